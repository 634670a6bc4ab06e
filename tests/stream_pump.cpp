#include "procsup/stream_pump.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace procsup;

namespace
{

/// Records every event a pump delivers
struct Recorder
{
    std::mutex mutex;
    std::vector<LineEvent> events;

    LineCallback callback()
    {
        return [this](const LineEvent& line)
        {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(line);
        };
    }

    std::vector<LineEvent> snapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

bool ready(const std::shared_future<void>& f)
{
    return f.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
}

} // namespace

int main()
{
    std::cout << "Test: lines in order, end marker exactly once and last...\n";
    {
        process::Process proc;
        proc.spawn({"sh", "-c", "for i in 1 2 3 4 5; do echo line$i; done"});
        Recorder rec;
        StreamPump pump(proc.take_stdout(), rec.callback());
        assert(ready(pump.finished()));
        pump.finished().get();

        auto events = rec.snapshot();
        assert(events.size() == 6);
        for (int i = 0; i < 5; ++i)
            assert(events[i] && *events[i] == "line" + std::to_string(i + 1));
        assert(!events.back());
        assert(proc.wait() == 0);
        std::cout << "  [PASS] 5 lines + 1 marker\n";
    }

    std::cout << "Test: silent stream delivers only the marker...\n";
    {
        process::Process proc;
        proc.spawn({"true"});
        Recorder rec;
        StreamPump pump(proc.take_stdout(), rec.callback());
        assert(ready(pump.finished()));
        auto events = rec.snapshot();
        assert(events.size() == 1);
        assert(!events[0]);
        proc.wait();
        std::cout << "  [PASS] marker only\n";
    }

    std::cout << "Test: throwing callback is isolated from the other stream...\n";
    {
        process::Process proc;
        proc.spawn({"sh", "-c", "printf 'o1\\no2\\no3\\n'; printf 'e1\\ne2\\n' >&2"});

        std::mutex mutex;
        std::vector<LineEvent> out_events;
        auto failing = [&](const LineEvent& line)
        {
            std::lock_guard<std::mutex> lock(mutex);
            out_events.push_back(line);
            if (line && *line == "o1")
                throw std::runtime_error("callback failed");
        };
        Recorder err_rec;

        StreamPump out_pump(proc.take_stdout(), failing);
        StreamPump err_pump(proc.take_stderr(), err_rec.callback());
        assert(ready(out_pump.finished()));
        assert(ready(err_pump.finished()));

        bool threw = false;
        try
        {
            out_pump.finished().get();
        }
        catch (const std::runtime_error& e)
        {
            threw = std::string(e.what()) == "callback failed";
        }
        assert(threw);

        {
            std::lock_guard<std::mutex> lock(mutex);
            // o2/o3 are drained but not delivered; the marker still is
            assert(out_events.size() == 2);
            assert(out_events[0] && *out_events[0] == "o1");
            assert(!out_events[1]);
        }

        err_pump.finished().get();
        auto err_events = err_rec.snapshot();
        assert(err_events.size() == 3);
        assert(*err_events[0] == "e1" && *err_events[1] == "e2" && !err_events[2]);
        assert(proc.wait() == 0);
        std::cout << "  [PASS] stdout failure kept out of stderr delivery\n";
    }

    std::cout << "Test: pump drains a large stream...\n";
    {
        process::Process proc;
        proc.spawn({"seq", "1", "20000"});
        std::mutex mutex;
        size_t count = 0;
        std::string last;
        bool marker = false;
        StreamPump pump(proc.take_stdout(),
                        [&](const LineEvent& line)
                        {
                            std::lock_guard<std::mutex> lock(mutex);
                            if (!line)
                            {
                                assert(!marker);
                                marker = true;
                                return;
                            }
                            assert(!marker);
                            ++count;
                            last = *line;
                        });
        assert(ready(pump.finished()));
        std::lock_guard<std::mutex> lock(mutex);
        assert(count == 20000);
        assert(last == "20000");
        assert(marker);
        proc.wait();
        std::cout << "  [PASS] 20000 lines\n";
    }

    std::cout << "\n[OK] stream pump tests passed\n";
    return 0;
}
