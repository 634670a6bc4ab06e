#include "runner_fixture.hpp"

#include <cassert>
#include <iostream>

using namespace procsup;
using procsup_test::RunnerFixture;

int main()
{
    std::cout << "Test: exit 0 returns normally...\n";
    {
        RunnerFixture fx("check_call_ok");
        fx.runner->check_call({"sh", "-c", "echo hello; echo oops >&2"});
        assert(fx.log_contains("[1] Running: sh -c 'echo hello; echo oops >&2'"));
        assert(fx.wait_for_log("001 | hello"));
        assert(fx.wait_for_log("001 | oops"));
        // Fast successes are not reported
        assert(!fx.log_contains("[1] ran in"));
        std::cout << "  [PASS] output logged under track 001\n";
    }

    std::cout << "Test: exit 3 raises CommandFailed with returncode 3...\n";
    {
        RunnerFixture fx("check_call_fail");
        bool failed = false;
        try
        {
            fx.runner->check_call({"sh", "-c", "exit 3"});
        }
        catch (const CommandFailed& e)
        {
            failed = true;
            assert(e.returncode() == 3);
            assert((e.args() == Args{"sh", "-c", "exit 3"}));
            assert(e.output().empty());
            assert(std::string(e.what()).find("non-zero exit status 3") != std::string::npos);
        }
        assert(failed);
        assert(fx.log_contains("[1] exit 3 in "));
        std::cout << "  [PASS] CommandFailed(3)\n";
    }

    std::cout << "Test: slow successes are reported...\n";
    {
        Settings settings;
        settings.slow_command_seconds = 0.0;
        RunnerFixture fx("check_call_slow", settings);
        fx.runner->check_call({"sh", "-c", "sleep 0.05"});
        assert(fx.log_contains("[1] ran in "));
        std::cout << "  [PASS] completion line written\n";
    }

    std::cout << "Test: spawn failure is logged with its track and rethrown...\n";
    {
        RunnerFixture fx("check_call_spawn");
        fx.runner->check_call({"true"});
        bool failed = false;
        try
        {
            fx.runner->check_call({"procsup-definitely-not-installed", "--flag"});
        }
        catch (const SpawnFailed&)
        {
            failed = true;
        }
        assert(failed);
        assert(fx.log_contains("[2] Failed to execute 'procsup-definitely-not-installed'"));
        std::cout << "  [PASS] SpawnFailed logged as track 2\n";
    }

    std::cout << "Test: each invocation gets the next track and a span...\n";
    {
        RunnerFixture fx("check_call_tracks");
        fx.runner->check_call({"true"});
        fx.runner->check_call({"true"});
        fx.runner->check_call({"true"});
        assert(fx.log_contains("[3] Running: true"));

        auto spans = fx.runner->finished_spans();
        assert(spans.size() == 3);
        assert(spans[0].name == "1 true");
        assert(spans[2].name == "3 true");
        assert(spans[2].attributes.at("procsup.track") == 3);
        assert(spans[0].status == telemetry::StatusCode::Ok);
        std::cout << "  [PASS] tracks 1..3 with spans\n";
    }

    std::cout << "Test: command spans nest under the caller's span...\n";
    {
        RunnerFixture fx("check_call_spans");
        {
            auto outer = fx.runner->span("deploy");
            fx.runner->check_call({"true"});
            bool failed = false;
            try
            {
                fx.runner->check_call({"false"});
            }
            catch (const CommandFailed&)
            {
                failed = true;
            }
            assert(failed);
        }
        auto spans = fx.runner->finished_spans();
        assert(spans.size() == 3);
        const auto& outer = spans.back();
        assert(outer.name == "deploy");
        assert(spans[0].parent == outer.id);
        assert(spans[1].parent == outer.id);
        assert(spans[1].status == telemetry::StatusCode::Error);
        assert(fx.log_contains("BEGIN SPAN deploy"));
        assert(fx.log_contains("END SPAN deploy"));
        // Command spans are not logged on their own
        assert(!fx.log_contains("END SPAN 1 true"));

        fx.runner->set_success(true);
        fx.runner->close();
        assert(fx.log_contains("Success. Starting cleanup."));
        assert(fx.log_contains("Timing summary:"));
        assert(fx.log_contains("s deploy\n"));
        std::cout << "  [PASS] nested spans and summary\n";
    }

    std::cout << "Test: long command lines are shortened in span names...\n";
    {
        RunnerFixture fx("check_call_long");
        Args args{"echo"};
        for (int i = 0; i < 40; ++i)
            args.push_back("argument" + std::to_string(i));
        fx.runner->check_call(args);
        auto spans = fx.runner->finished_spans();
        assert(spans.size() == 1);
        assert(spans[0].name.size() == 80);
        assert(spans[0].name.rfind("1 echo argument0", 0) == 0);
        std::cout << "  [PASS] span name capped at 80 characters\n";
    }

    std::cout << "\n[OK] check_call tests passed\n";
    return 0;
}
