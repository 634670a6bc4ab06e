#include "procsup/launcher.hpp"

#include <exception>
#include <iostream>
#include <thread>
#include <vector>

namespace procsup
{

namespace
{

process::ProcessOptions normalize(const LaunchOptions& options)
{
    process::ProcessOptions normalized;
    normalized.working_directory = options.working_directory;
    normalized.environment = options.environment;
    normalized.inherit_environment = options.inherit_environment;

    if (options.input)
    {
        if (options.stdin_mode)
            throw ValidationError("Launch input cannot be combined with an explicit stdin mode");
        normalized.stdin_mode = StreamMode::Pipe;
    }
    else
    {
        normalized.stdin_mode = options.stdin_mode.value_or(StreamMode::Null);
    }
    normalized.stdout_mode = options.stdout_mode.value_or(StreamMode::Pipe);
    normalized.stderr_mode = options.stderr_mode.value_or(StreamMode::Pipe);
    return normalized;
}

void feed_input(process::Process& proc, const std::string& input)
{
    auto& pipe = proc.stdin_pipe();
    try
    {
        pipe.write(input);
    }
    catch (const process::BrokenPipeError&)
    {
        // The child exited or closed stdin without reading everything
    }
    pipe.close();
}

} // namespace

ProcessHandle launch(const LaunchSpec& spec, LineCallback out_callback, LineCallback err_callback,
                     CompletionCallback on_complete)
{
    auto options = normalize(spec.options);

    auto proc = std::make_shared<process::Process>();
    proc->spawn(spec.args, options);

    std::vector<std::shared_future<void>> pumps;
    if (auto out = proc->take_stdout())
        pumps.push_back(StreamPump(std::move(out), std::move(out_callback)).finished());
    if (auto err = proc->take_stderr())
        pumps.push_back(StreamPump(std::move(err), std::move(err_callback)).finished());

    if (on_complete)
    {
        std::thread(
            [proc, pumps, on_complete = std::move(on_complete)]()
            {
                try
                {
                    if (pumps.empty())
                    {
                        proc->wait();
                    }
                    else
                    {
                        for (const auto& pump : pumps)
                            pump.wait();
                    }
                    on_complete(proc);
                }
                catch (const std::exception& e)
                {
                    std::cerr << "procsup: completion handler for pid " << proc->pid()
                              << " failed: " << e.what() << std::endl;
                }
            })
            .detach();
    }

    if (spec.options.input)
        feed_input(*proc, *spec.options.input);

    return proc;
}

} // namespace procsup
