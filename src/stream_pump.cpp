#include "procsup/stream_pump.hpp"

#include <exception>
#include <thread>

namespace procsup
{

namespace
{

void pump_stream(process::ReadPipe& pipe, const LineCallback& callback,
                 std::promise<void>& done)
{
    std::exception_ptr failure;

    while (true)
    {
        LineEvent line;
        try
        {
            line = pipe.read_line();
        }
        catch (const process::ProcessError&)
        {
            if (!failure)
                failure = std::current_exception();
            break;
        }
        if (!line)
            break;

        // After a callback failure the pipe is still drained so the child
        // never blocks on a full pipe
        if (failure || !callback)
            continue;
        try
        {
            callback(line);
        }
        catch (...)
        {
            failure = std::current_exception();
        }
    }
    pipe.close();

    if (callback)
    {
        try
        {
            callback(std::nullopt);
        }
        catch (...)
        {
            if (!failure)
                failure = std::current_exception();
        }
    }

    if (failure)
        done.set_exception(failure);
    else
        done.set_value();
}

} // namespace

StreamPump::StreamPump(std::unique_ptr<process::ReadPipe> pipe, LineCallback callback)
{
    auto done = std::make_shared<std::promise<void>>();
    finished_ = done->get_future().share();

    std::shared_ptr<process::ReadPipe> owned(std::move(pipe));
    std::thread(
        [owned, callback = std::move(callback), done]()
        { pump_stream(*owned, callback, *done); })
        .detach();
}

} // namespace procsup
