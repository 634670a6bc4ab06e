// Example demonstrating the three execution modes of procsup::Runner
//
// Every command gets its own track number; its output lines show up in the
// log prefixed with that number, and its timing lands in the span summary
// printed when the session closes.
//
// Usage: procsup_run_commands [logfile]   ("-" logs to stdout, the default)

#include "procsup.hpp"

#include <iostream>
#include <thread>

int main(int argc, char** argv)
{
    using namespace procsup;

    std::string logfile = argc > 1 ? argv[1] : "-";
    auto runner = Runner::open(logfile, "kubectl", false);

    try
    {
        auto session = runner->span("demo");

        // ============================================================================
        // check_call: wait for exit, throw on failure
        // ============================================================================
        runner->check_call({"sh", "-c", "echo building; echo warnings >&2"});

        // ============================================================================
        // get_output: capture stdout
        // ============================================================================
        auto kernel = runner->get_output({"uname", "-s"});
        runner->write("Kernel: " + kernel);

        try
        {
            runner->get_output({"sh", "-c", "echo partial; exit 3"});
        }
        catch (const CommandFailed& e)
        {
            runner->write(std::string(e.what()) + " (output: " + e.output() + ")");
        }

        // ============================================================================
        // popen: run in the background, exit code logged on completion
        // ============================================================================
        std::vector<ProcessHandle> workers;
        for (int i = 0; i < 3; ++i)
            workers.push_back(
                runner->popen({"sh", "-c", "for n in 1 2 3; do echo tick $n; sleep 0.1; done"}));
        for (auto& worker : workers)
            worker->wait();

        // Give the completion watchers a moment to log the exit lines
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    catch (const Error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << runner->read_logs() << "\n";
        return 1;
    }

    runner->set_success(true);
    runner->close();
    return 0;
}
