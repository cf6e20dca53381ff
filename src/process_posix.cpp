// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT
//
// Process management code borrowed from claude-agent-sdk-cpp:
// https://github.com/0xeb/claude-agent-sdk-cpp
// See: src/internal/subprocess/process_posix.cpp

// POSIX implementation of subprocess process management
// For Linux and macOS

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <dazmcp/process.hpp>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace dazmcp
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
    bool own_group = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

/// Create a pipe whose ends are not inherited by other children
///
/// The server forks from several connection threads at once; without
/// close-on-exec a sibling child could hold our write end open and delay EOF.
static int make_pipe(int fds[2])
{
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC);
#else
    if (::pipe(fds) != 0)
        return -1;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

static void close_pair(int fds[2])
{
    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Only async-signal-safe calls between fork and exec/_exit
[[noreturn]] static void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

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

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // No data available (non-blocking)
        throw ProcessError("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    line.reserve(256);

    char ch;
    while (line.size() < max_size)
    {
        size_t bytes_read = read(&ch, 1);
        if (bytes_read == 0)
            break; // EOF
        line.push_back(ch);
        if (ch == '\n')
            break;
    }

    return line;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd{};
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("poll failed: " + get_errno_message());
    }

    return result > 0 && (pfd.revents & (POLLIN | POLLHUP)) != 0;
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

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
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
    // Close pipes first
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    // Then make sure no child is left behind unreaped
    if (handle_ && handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere; nothing left to release
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const ProcessOptions& options
)
{
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    auto cleanup = [&]()
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
    };

    if (options.redirect_stdin && make_pipe(stdin_pipe) != 0)
    {
        std::string message = "Failed to create stdin pipe: " + get_errno_message();
        cleanup();
        throw ProcessError(message);
    }
    if (options.redirect_stdout && make_pipe(stdout_pipe) != 0)
    {
        std::string message = "Failed to create stdout pipe: " + get_errno_message();
        cleanup();
        throw ProcessError(message);
    }
    if (options.redirect_stderr && make_pipe(stderr_pipe) != 0)
    {
        std::string message = "Failed to create stderr pipe: " + get_errno_message();
        cleanup();
        throw ProcessError(message);
    }
    // Error pipe for detecting exec failures (close-on-exec closes it on successful exec)
    if (make_pipe(error_pipe) != 0)
    {
        std::string message = "Failed to create error pipe: " + get_errno_message();
        cleanup();
        throw ProcessError(message);
    }

    // Build argv before forking; the child may only make async-signal-safe calls
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        std::string message = "Failed to fork process: " + get_errno_message();
        cleanup();
        throw ProcessError(message);
    }

    if (pid == 0)
    {
        // Child process
        ::close(error_pipe[0]);

        if (options.new_process_group)
            setpgid(0, 0);

        // dup2 clears close-on-exec on the target descriptor
        if (options.redirect_stdin && dup2(stdin_pipe[0], STDIN_FILENO) < 0)
            child_fail(error_pipe[1]);
        if (options.redirect_stdout && dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
            child_fail(error_pipe[1]);
        if (options.redirect_stderr && dup2(stderr_pipe[1], STDERR_FILENO) < 0)
            child_fail(error_pipe[1]);

        signal(SIGPIPE, SIG_DFL);
        sigset_t no_signals;
        sigemptyset(&no_signals);
        sigprocmask(SIG_SETMASK, &no_signals, nullptr);

        execvp(executable.c_str(), argv.data());

        // If execvp returns, it failed - write error to pipe
        child_fail(error_pipe[1]);
    }

    // Parent process

    // Close write end of error pipe and check for exec errors
    ::close(error_pipe[1]);
    error_pipe[1] = -1;
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    ::close(error_pipe[0]);
    error_pipe[0] = -1;

    if (error_bytes > 0)
    {
        // Exec failed in child - reap it, clean up and throw
        waitpid(pid, nullptr, 0);
        cleanup();
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    // Close unused pipe ends and store handles
    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_->handle_->fd = stderr_pipe[0];
    }

    // Store process information
    handle_->pid = pid;
    handle_->running = true;
    handle_->own_group = options.new_process_group;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

CommunicateResult Process::communicate(std::chrono::milliseconds timeout)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    CommunicateResult result;

    auto remaining_ms = [&]() -> int
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        return static_cast<int>(std::max<int64_t>(0, left.count()));
    };

    char buffer[4096];

    // Drain both pipes together so neither can fill up and stall the child
    while (stdout_->is_open() || stderr_->is_open())
    {
        int wait_ms = remaining_ms();
        if (wait_ms == 0)
        {
            result.timed_out = true;
            return result;
        }

        struct pollfd fds[2];
        ReadPipe* pipes[2];
        std::string* sinks[2];
        nfds_t count = 0;
        if (stdout_->is_open())
        {
            fds[count] = {stdout_->handle_->fd, POLLIN, 0};
            pipes[count] = stdout_.get();
            sinks[count] = &result.stdout_data;
            ++count;
        }
        if (stderr_->is_open())
        {
            fds[count] = {stderr_->handle_->fd, POLLIN, 0};
            pipes[count] = stderr_.get();
            sinks[count] = &result.stderr_data;
            ++count;
        }

        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            throw ProcessError("poll failed: " + get_errno_message());
        }

        for (nfds_t i = 0; i < count; ++i)
        {
            if (fds[i].revents == 0)
                continue;
            size_t n = pipes[i]->read(buffer, sizeof(buffer));
            if (n == 0)
                pipes[i]->close();
            else
                sinks[i]->append(buffer, n);
        }
    }

    // Output is closed; the process may still be finishing
    while (true)
    {
        if (auto code = try_wait())
        {
            result.exit_code = code;
            return result;
        }
        int wait_ms = remaining_ms();
        if (wait_ms == 0)
        {
            result.timed_out = true;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(wait_ms, 10)));
    }
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0)
        return false;

    if (!handle_->running)
        return false;

    // Check process status using kill with signal 0
    int result = ::kill(handle_->pid, 0);
    if (result == 0)
        return true; // Process exists

    if (errno == ESRCH)
        return false; // Process doesn't exist

    // For other errors (EPERM), assume process exists
    return true;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        // Process is still running
        return std::nullopt;
    }

    throw ProcessError("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    handle_->running = false;
    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::send_signal(int signal)
{
    if (!handle_ || handle_->pid <= 0 || !handle_->running)
        return;

    if (handle_->own_group)
        ::kill(-handle_->pid, signal);
    else
        ::kill(handle_->pid, signal);
}

void Process::terminate()
{
    send_signal(SIGTERM);
}

void Process::kill()
{
    send_signal(SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    // If it's an absolute path, check if it exists and is executable
    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (fs::exists(exe_path) && access(exe_path.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    // If name contains a path separator, treat as relative path
    if (name.find('/') != std::string::npos)
    {
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name).string();
        return std::nullopt;
    }

    // Search in PATH environment variable
    const char* path_env = std::getenv("PATH");
    if (!path_env)
    {
        // No PATH set - try current directory
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name).string();
        return std::nullopt;
    }

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            std::error_code ec;
            if (fs::exists(test_path, ec) && access(test_path.c_str(), X_OK) == 0)
                return test_path.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace dazmcp
