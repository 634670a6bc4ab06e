// POSIX implementation of subprocess process management

#include "procsup/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <pthread.h>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace procsup::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

namespace
{

/// Both ends of a pipe; closes whatever is still owned on scope exit
struct PipePair
{
    int fds[2] = {-1, -1};

    PipePair() = default;
    PipePair(const PipePair&) = delete;
    PipePair& operator=(const PipePair&) = delete;

    ~PipePair()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        // O_CLOEXEC keeps concurrently spawned children from inheriting our ends
        if (pipe2(fds, O_CLOEXEC) != 0)
        {
            int err = errno;
            throw SpawnFailed(std::string("Failed to create ") + what +
                                  " pipe: " + get_errno_message(err),
                              err);
        }
    }

    int release_read()
    {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }

    int release_write()
    {
        int fd = fds[1];
        fds[1] = -1;
        return fd;
    }

    void close_read()
    {
        if (fds[0] >= 0)
            ::close(fds[0]);
        fds[0] = -1;
    }

    void close_write()
    {
        if (fds[1] >= 0)
            ::close(fds[1]);
        fds[1] = -1;
    }
};

/// Blocks SIGPIPE on the calling thread so a vanished reader surfaces as EPIPE
class SigpipeGuard
{
  public:
    SigpipeGuard()
    {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);
        sigset_t pending;
        sigpending(&pending);
        already_pending_ = sigismember(&pending, SIGPIPE) == 1;
        pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_set_);
    }

    ~SigpipeGuard()
    {
        if (raised_ && !already_pending_)
        {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR)
                ;
        }
        pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
    }

    void mark_raised()
    {
        raised_ = true;
    }

  private:
    sigset_t pipe_set_;
    sigset_t old_set_;
    bool already_pending_ = false;
    bool raised_ = false;
};

void write_child_error(int fd, int err)
{
    (void)!::write(fd, &err, sizeof(err));
}

[[noreturn]] void child_fail(int error_fd)
{
    write_child_error(error_fd, errno);
    _exit(127);
}

std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::vector<std::string> env;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string item(*entry);
            auto eq = item.find('=');
            std::string key = eq == std::string::npos ? item : item.substr(0, eq);
            if (options.environment.count(key) == 0)
                env.push_back(std::move(item));
        }
    }
    for (const auto& [key, value] : options.environment)
        env.push_back(key + "=" + value);
    return env;
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno != EINTR)
            throw ProcessError("Read failed: " + get_errno_message());
    }
}

std::optional<std::string> ReadPipe::read_line()
{
    while (true)
    {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos)
        {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        if (eof_)
        {
            if (buffer_.empty())
                return std::nullopt;
            // Final line without a terminator
            std::string line;
            line.swap(buffer_);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        char chunk[4096];
        size_t bytes_read = read(chunk, sizeof(chunk));
        if (bytes_read == 0)
            eof_ = true;
        else
            buffer_.append(chunk, bytes_read);
    }
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    SigpipeGuard guard;
    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
            {
                guard.mark_raised();
                throw BrokenPipeError("Broken pipe (process closed stdin)");
            }
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    try
    {
        if (is_running())
        {
            terminate();
            wait();
        }
    }
    catch (const ProcessError& e)
    {
        std::fprintf(stderr, "procsup: failed to reap pid %d: %s\n", pid(), e.what());
    }
}

void Process::spawn(const Args& argv, const ProcessOptions& options)
{
    if (argv.empty())
        throw ValidationError("Cannot spawn an empty argument vector");
    if (handle_->pid != 0)
        throw ProcessError("Process already spawned");
    if (options.stdout_mode == StreamMode::Stdout || options.stdin_mode == StreamMode::Stdout)
        throw ValidationError("StreamMode::Stdout is only valid for stderr");

    PipePair stdin_pipe;
    if (options.stdin_mode == StreamMode::Pipe)
        stdin_pipe.open("stdin");

    PipePair stdout_pipe;
    if (options.stdout_mode == StreamMode::Pipe)
        stdout_pipe.open("stdout");

    PipePair stderr_pipe;
    if (options.stderr_mode == StreamMode::Pipe)
        stderr_pipe.open("stderr");

    // Error pipe for detecting exec failures
    PipePair error_pipe;
    error_pipe.open("error");

    // Everything the child needs is allocated before fork
    std::vector<std::string> env = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& item : env)
        envp.push_back(item.data());
    envp.push_back(nullptr);

    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv)
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    child_argv.push_back(nullptr);

    const char* workdir =
        options.working_directory.empty() ? nullptr : options.working_directory.c_str();

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        throw SpawnFailed("Failed to fork process: " + get_errno_message(err), err);
    }

    if (pid == 0)
    {
        // Child process: only async-signal-safe calls from here on
        int error_fd = error_pipe.fds[1];

        auto attach = [error_fd](StreamMode mode, int pipe_fd, int target, int null_flags)
        {
            if (mode == StreamMode::Pipe)
            {
                if (dup2(pipe_fd, target) < 0)
                    child_fail(error_fd);
            }
            else if (mode == StreamMode::Null)
            {
                int null_fd = ::open("/dev/null", null_flags);
                if (null_fd < 0 || dup2(null_fd, target) < 0)
                    child_fail(error_fd);
                if (null_fd != target)
                    ::close(null_fd);
            }
        };

        attach(options.stdin_mode, stdin_pipe.fds[0], STDIN_FILENO, O_RDONLY);
        attach(options.stdout_mode, stdout_pipe.fds[1], STDOUT_FILENO, O_WRONLY);
        if (options.stderr_mode == StreamMode::Stdout)
        {
            if (dup2(STDOUT_FILENO, STDERR_FILENO) < 0)
                child_fail(error_fd);
        }
        else
        {
            attach(options.stderr_mode, stderr_pipe.fds[1], STDERR_FILENO, O_WRONLY);
        }

        if (workdir && chdir(workdir) != 0)
            child_fail(error_fd);

        execvpe(child_argv[0], child_argv.data(), envp.data());
        child_fail(error_fd);
    }

    // Parent process
    error_pipe.close_write();
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe.fds[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        throw SpawnFailed("Failed to execute '" + argv[0] + "': " + get_errno_message(child_errno),
                          child_errno);
    }

    if (options.stdin_mode == StreamMode::Pipe)
        stdin_->handle_->fd = stdin_pipe.release_write();

    if (options.stdout_mode == StreamMode::Pipe)
        stdout_->handle_->fd = stdout_pipe.release_read();

    if (options.stderr_mode == StreamMode::Pipe)
        stderr_->handle_->fd = stderr_pipe.release_read();

    std::lock_guard<std::mutex> lock(mutex_);
    args_ = argv;
    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

std::unique_ptr<ReadPipe> Process::take_stdout()
{
    if (!stdout_ || !stdout_->is_open())
        return nullptr;
    return std::move(stdout_);
}

std::unique_ptr<ReadPipe> Process::take_stderr()
{
    if (!stderr_ || !stderr_->is_open())
        return nullptr;
    return std::move(stderr_);
}

bool Process::is_running()
{
    return !try_wait().has_value();
}

// Caller holds mutex_
std::optional<int> Process::reap(bool block)
{
    if (handle_->pid == 0)
        return handle_->exit_code;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + get_errno_message());
}

std::optional<int> Process::try_wait()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reap(false);
}

int Process::wait()
{
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handle_->pid == 0 || !handle_->running)
            return handle_->exit_code;
        pid = handle_->pid;
    }

    // Block until the child exits without reaping it, so a concurrent
    // try_wait() never races a blocking waitpid() for the same pid.
    siginfo_t info;
    while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0)
    {
        if (errno == EINTR)
            continue;
        if (errno == ECHILD)
            break; // already reaped by another waiter
        throw ProcessError("waitid failed: " + get_errno_message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto code = reap(true);
    return code.value_or(-1);
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

std::optional<int> Process::returncode() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_->pid == 0 || handle_->running)
        return std::nullopt;
    return handle_->exit_code;
}

void Process::terminate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(handle_->pid);
}

} // namespace procsup::process
