// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT
//
// Process management code borrowed from claude-agent-sdk-cpp:
// https://github.com/0xeb/claude-agent-sdk-cpp
// See: src/internal/subprocess/process.hpp

#pragma once

/// @file process.hpp
/// @brief POSIX process management for renderer invocations

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dazmcp
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// =============================================================================
// Error Types
// =============================================================================

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// ReadPipe - Read from subprocess stdout/stderr
// =============================================================================

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // Move-only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    /// @throws ProcessError on read failure
    size_t read(char* buffer, size_t size);

    /// Read a line (up to newline or max_size)
    /// @return Line including newline, or partial line on EOF
    std::string read_line(size_t max_size = 4096);

    /// Check if data is available without blocking
    /// @param timeout_ms Timeout in milliseconds (0 = non-blocking check)
    /// @return true if data is available
    bool has_data(int timeout_ms = 0);

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// =============================================================================
// WritePipe - Write to subprocess stdin
// =============================================================================

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // Move-only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write data to the pipe
    /// @return Number of bytes written
    /// @throws ProcessError on write failure
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

// =============================================================================
// ProcessOptions - Configuration for process spawning
// =============================================================================

/// Options for spawning a subprocess
struct ProcessOptions
{
    /// Whether to redirect stdin (pipe to subprocess)
    bool redirect_stdin = true;

    /// Whether to redirect stdout (pipe from subprocess)
    bool redirect_stdout = true;

    /// Whether to redirect stderr (pipe from subprocess)
    bool redirect_stderr = false;

    /// Start the child in its own process group; terminate()/kill() then
    /// signal the whole group, including anything the child spawned
    bool new_process_group = false;
};

/// Output collected by Process::communicate
struct CommunicateResult
{
    std::string stdout_data;
    std::string stderr_data;
    std::optional<int> exit_code; // nullopt when the deadline passed first
    bool timed_out = false;
};

// =============================================================================
// Process - POSIX subprocess management
// =============================================================================

/// POSIX subprocess management
///
/// Example usage:
/// @code
/// Process proc;
/// ProcessOptions opts;
/// opts.redirect_stderr = true;
/// proc.spawn("dazstudio", {"-noPrompt", "-script", "/scripts/read_scene.dsa"}, opts);
/// proc.stdin_pipe().close();
///
/// auto out = proc.communicate(std::chrono::seconds(60));
/// if (out.timed_out)
///     proc.kill();
/// @endcode
class Process
{
  public:
    Process();
    ~Process();

    // Move-only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process
    /// @param executable Path to executable (can be relative or absolute)
    /// @param args Command line arguments (not including executable)
    /// @param options Process configuration
    /// @throws ProcessError if spawn fails
    void spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}
    );

    /// Get stdin pipe (only valid if redirect_stdin was true)
    /// @throws ProcessError if stdin was not redirected
    WritePipe& stdin_pipe();

    /// Get stdout pipe (only valid if redirect_stdout was true)
    /// @throws ProcessError if stdout was not redirected
    ReadPipe& stdout_pipe();

    /// Get stderr pipe (only valid if redirect_stderr was true)
    /// @throws ProcessError if stderr was not redirected
    ReadPipe& stderr_pipe();

    /// Drain redirected stdout/stderr until both reach EOF and the process
    /// exits, or until `timeout` elapses
    ///
    /// On timeout the process is left running; the caller decides whether to
    /// kill it. Output read before the deadline is returned either way.
    /// @throws ProcessError on read or wait failure
    CommunicateResult communicate(std::chrono::milliseconds timeout);

    /// Check if process is still running
    bool is_running() const;

    /// Non-blocking wait for process termination
    /// @return Exit code if process has terminated, std::nullopt if still running
    std::optional<int> try_wait();

    /// Blocking wait for process termination
    /// @return Exit code
    int wait();

    /// Request graceful termination (SIGTERM)
    void terminate();

    /// Forcefully kill the process (SIGKILL)
    void kill();

    /// Send `signal` to the process (or its group, see ProcessOptions)
    void send_signal(int signal);

    /// Get process ID
    /// @return Process ID, or 0 if not spawned
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// Find an executable in the system PATH
/// @param name Executable name or path
/// @return Full path to executable, or std::nullopt if not found
std::optional<std::string> find_executable(const std::string& name);

} // namespace dazmcp
