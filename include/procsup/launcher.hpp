#pragma once
#include "procsup/process.hpp"
#include "procsup/stream_pump.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace procsup
{

using process::SpawnFailed;
using process::StreamMode;
using ProcessHandle = std::shared_ptr<process::Process>;

/// Process configuration for a launch. Unset stream modes use the launcher
/// defaults: stdin from the null device (or a pipe when input is given),
/// stdout and stderr piped.
struct LaunchOptions
{
    /// Text fed to the child's stdin; the pipe is closed after it is written
    std::optional<std::string> input;
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    std::optional<StreamMode> stdin_mode;
    std::optional<StreamMode> stdout_mode;
    std::optional<StreamMode> stderr_mode;
};

struct LaunchSpec
{
    Args args;
    LaunchOptions options;
};

using CompletionCallback = std::function<void(const ProcessHandle&)>;

/**
 * Spawn a child and wire its output streams to line callbacks.
 *
 * One StreamPump is started per piped stream. When on_complete is given, a
 * watcher thread calls it exactly once: after every started pump delivered
 * its end-of-stream marker, or after the child exits if nothing is piped.
 *
 * Returns without waiting for the child to exit.
 *
 * @throws ValidationError if input is combined with an explicit stdin mode
 * @throws SpawnFailed if the child could not be started
 */
ProcessHandle launch(const LaunchSpec& spec, LineCallback out_callback, LineCallback err_callback,
                     CompletionCallback on_complete = nullptr);

} // namespace procsup
