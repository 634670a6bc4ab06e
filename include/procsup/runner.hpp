#pragma once
#include "procsup/cache.hpp"
#include "procsup/launcher.hpp"
#include "procsup/output.hpp"
#include "procsup/settings.hpp"
#include "procsup/telemetry.hpp"
#include "procsup/track.hpp"

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace procsup
{

/// Logs every line of one stream under the zero-padded track prefix ("007")
struct TrackLogger
{
    std::shared_ptr<Output> output;
    std::string prefix;

    TrackLogger(std::shared_ptr<Output> output, Track track);

    void operator()(const LineEvent& line) const
    {
        if (line)
            output->write(*line, prefix);
    }
};

/// Stdout lines of one get_output() call, handed to the waiting caller
/// once the end-of-stream marker arrives
class CaptureBuffer
{
  public:
    CaptureBuffer();

    /// Append a line; std::nullopt closes the buffer
    void append(const LineEvent& line);

    /// Block until the buffer is closed, then return the captured lines
    std::vector<std::string> wait() const;

  private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    bool closed_ = false;
    std::promise<void> closed_promise_;
    std::shared_future<void> closed_future_;
};

/**
 * Runs subprocesses for a session, logging their output to a shared Output.
 *
 * Every invocation gets a fresh track, used to prefix its log lines, and a
 * timing span. Three execution modes:
 *
 * - check_call(): wait for exit, throw CommandFailed on a nonzero status
 * - get_output(): like check_call(), but capture and return stdout
 * - popen(): return the running process at once; log its exit code later
 *
 * All methods may be called from several threads at once.
 */
class Runner
{
  public:
    Runner(std::shared_ptr<Output> output, Settings settings);
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    /// Open a session logging to logfile_path ("-" for stdout). Remaining
    /// settings come from the environment. Logs tool versions on startup.
    static std::unique_ptr<Runner> open(const std::filesystem::path& logfile_path,
                                        const std::string& kubectl_cmd, bool verbose);

    /// Log the versions of kubectl, oc and the kernel; tools that are not
    /// installed are skipped
    void log_environment();

    // ========================================================================
    // Execution modes
    // ========================================================================

    /// Run a command and make sure it exited with 0
    /// @throws CommandFailed on a nonzero exit status
    /// @throws SpawnFailed if the command could not be started
    void check_call(const Args& args, const LaunchOptions& options = {});

    /// Run a command and return its stdout, with surrounding whitespace
    /// trimmed. stdout is echoed to the log when reveal or verbose is set.
    /// @throws CommandFailed carrying the captured output on a nonzero exit
    /// @throws SpawnFailed if the command could not be started
    std::string get_output(const Args& args, bool reveal = false,
                           const LaunchOptions& options = {});

    /// Launch a command without waiting for it
    /// @throws SpawnFailed if the command could not be started
    ProcessHandle popen(const Args& args, const LaunchOptions& options = {});

    // ========================================================================
    // kubectl helpers
    // ========================================================================

    /// [kubectl_cmd, ("--v=4"), "--context", context, "--namespace", namespace, args...]
    Args kubectl(const std::string& context, const std::string& namespace_,
                 const Args& args) const;

    /// Output of a kubectl command; its stderr goes to our own stderr by default
    std::string get_kubectl(const std::string& context, const std::string& namespace_,
                            const Args& args,
                            std::optional<StreamMode> stderr_mode = StreamMode::Inherit);

    void check_kubectl(const std::string& context, const std::string& namespace_,
                       const Args& args, const LaunchOptions& options = {});

    // ========================================================================
    // Session
    // ========================================================================

    /// Open a nested span; logs its begin and end when verbose
    telemetry::SpanScope span(const std::string& name, bool verbose = true);

    void write(const std::string& message, const std::string& prefix = "TEL");

    /// Most recent log lines
    std::string read_logs() const;

    /// Record whether the session succeeded; on success close() logs the
    /// span summary
    void set_success(bool flag);

    /// Log the span summary (if the session succeeded). Idempotent.
    void close();

    bool verbose() const
    {
        return settings_.verbose;
    }
    const std::string& kubectl_cmd() const
    {
        return settings_.kubectl_cmd;
    }
    const std::shared_ptr<Output>& output() const
    {
        return output_;
    }
    Cache& cache()
    {
        return cache_;
    }
    std::vector<telemetry::Span> finished_spans() const;

  private:
    telemetry::SpanScope command_span(Track track, const Args& args);
    void write_track(Track track, const std::string& message);
    ProcessHandle launch_command(Track track, LineCallback out_cb, LineCallback err_cb,
                                 const Args& args, const LaunchOptions& options,
                                 CompletionCallback done = nullptr);
    void run_command(Track track, const std::string& running, const std::string& ran,
                     LineCallback out_cb, LineCallback err_cb, const Args& args,
                     const LaunchOptions& options);

    std::shared_ptr<Output> output_;
    Settings settings_;
    TrackSequencer tracks_;
    std::shared_ptr<telemetry::InMemorySpanExporter> spans_;
    telemetry::Tracer tracer_;
    Cache cache_;
    std::atomic<bool> success_{false};
    std::atomic<bool> closed_{false};
};

} // namespace procsup
