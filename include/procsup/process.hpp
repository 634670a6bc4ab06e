// POSIX process management for procsup
// Pipes, fork/exec and exit-status tracking for a single child process

#pragma once

#include "procsup/exceptions.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace procsup::process
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public Error
{
  public:
    explicit ProcessError(const std::string& message) : Error(message) {}
};

/// Writing to a pipe whose reader has gone away
class BrokenPipeError : public ProcessError
{
  public:
    using ProcessError::ProcessError;
};

/// The child could not be started (missing executable, permission denied, ...)
class SpawnFailed : public ProcessError
{
  public:
    SpawnFailed(const std::string& message, int error_code)
        : ProcessError(message), error_code_(error_code)
    {
    }

    /// errno reported by the failing system call
    int error_code() const
    {
        return error_code_;
    }

  private:
    int error_code_;
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Read the next line without its terminator ("\n" or "\r\n")
    /// @return std::nullopt once the writer closed its end and no data is left
    std::optional<std::string> read_line();

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
    std::string buffer_;
    bool eof_ = false;
};

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write data to the pipe
    /// @throws BrokenPipeError if the child closed its end
    size_t write(const char* data, size_t size);

    /// Write string to the pipe
    size_t write(const std::string& data);

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Where a standard stream of the child is connected
enum class StreamMode
{
    Pipe,    ///< Pipe readable/writable by the parent
    Null,    ///< /dev/null
    Inherit, ///< Parent's descriptor
    Stdout   ///< stderr only: merged into the child's stdout
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    StreamMode stdin_mode = StreamMode::Null;
    StreamMode stdout_mode = StreamMode::Pipe;
    StreamMode stderr_mode = StreamMode::Pipe;
};

/// A single child process. wait() and try_wait() may be called from
/// different threads at the same time.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Spawn a new process; argv[0] is looked up in PATH
    /// @throws SpawnFailed if the child could not be started
    void spawn(const Args& argv, const ProcessOptions& options = {});

    /// Arguments the process was spawned with
    const Args& args() const
    {
        return args_;
    }

    /// Get stdin pipe (only valid if stdin_mode was Pipe)
    WritePipe& stdin_pipe();

    /// Transfer ownership of the stdout pipe; null if stdout is not piped
    std::unique_ptr<ReadPipe> take_stdout();

    /// Transfer ownership of the stderr pipe; null if stderr is not piped
    std::unique_ptr<ReadPipe> take_stderr();

    /// Check if process is still running
    bool is_running();

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Blocking wait for process termination
    int wait();

    /// Wait at most timeout for process termination
    /// @return Exit code, or std::nullopt if the process is still running
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Exit code if the process has already been reaped
    std::optional<int> returncode() const;

    /// Request graceful termination
    void terminate();

    /// Forcefully kill the process
    void kill();

    /// Get process ID
    int pid() const;

  private:
    std::optional<int> reap(bool block);

    Args args_;
    mutable std::mutex mutex_;
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

} // namespace procsup::process
