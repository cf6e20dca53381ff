// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <dazmcp/transport.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace dazmcp
{

/// Transport that wraps stdio file descriptors (stdin/stdout or pipe ends)
///
/// This is used for the stdio JSON-RPC mode where the server talks to its
/// client over the process's own standard streams.
class StdioTransport : public ITransport
{
  public:
    using Handle = int;
    static constexpr Handle invalid_handle()
    {
        return -1;
    }

    /// Construct from read/write handles
    /// @param read_handle Handle to read from (e.g., STDIN_FILENO)
    /// @param write_handle Handle to write to (e.g., STDOUT_FILENO)
    /// @param owns_handles If true, handles will be closed on destruction
    StdioTransport(Handle read_handle, Handle write_handle, bool owns_handles = true)
        : read_handle_(read_handle), write_handle_(write_handle), owns_handles_(owns_handles),
          open_(true), eof_(false)
    {
    }

    ~StdioTransport() override
    {
        close();
    }

    // Non-copyable
    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    // Movable
    StdioTransport(StdioTransport&& other) noexcept
        : read_handle_(other.read_handle_), write_handle_(other.write_handle_),
          owns_handles_(other.owns_handles_), open_(other.open_.load()), eof_(other.eof_.load())
    {
        other.read_handle_ = invalid_handle();
        other.write_handle_ = invalid_handle();
        other.owns_handles_ = false;
        other.open_ = false;
    }

    StdioTransport& operator=(StdioTransport&& other) noexcept
    {
        if (this != &other)
        {
            close();
            read_handle_ = other.read_handle_;
            write_handle_ = other.write_handle_;
            owns_handles_ = other.owns_handles_;
            open_ = other.open_.load();
            eof_ = other.eof_.load();
            other.read_handle_ = invalid_handle();
            other.write_handle_ = invalid_handle();
            other.owns_handles_ = false;
            other.open_ = false;
        }
        return *this;
    }

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    void close() override;
    /// False once closed or once the read side has reached end of input
    bool is_open() const override
    {
        return open_ && !eof_;
    }

    Handle read_handle() const
    {
        return read_handle_;
    }
    Handle write_handle() const
    {
        return write_handle_;
    }

  private:
    Handle read_handle_;
    Handle write_handle_;
    bool owns_handles_;
    std::atomic<bool> open_;
    std::atomic<bool> eof_;
};

// =============================================================================
// POSIX implementation
// =============================================================================

inline size_t StdioTransport::read(char* buffer, size_t size)
{
    if (!open_ || eof_)
        throw ConnectionClosedError();

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(read_handle_, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EPIPE || errno == EBADF)
        {
            eof_ = true;
            return 0;
        }
        throw TransportError("read() failed: " + std::string(strerror(errno)));
    }

    if (bytes_read == 0)
        eof_ = true;
    return static_cast<size_t>(bytes_read);
}

inline void StdioTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    // Writes go straight to the descriptor, so a completed write is already flushed.
    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(write_handle_, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            throw TransportError("write() failed: " + std::string(strerror(errno)));
        }
        total_written += static_cast<size_t>(bytes_written);
    }
}

inline void StdioTransport::close()
{
    if (!open_.exchange(false))
        return;

    if (owns_handles_)
    {
        if (read_handle_ != invalid_handle())
            ::close(read_handle_);
        if (write_handle_ != invalid_handle() && write_handle_ != read_handle_)
            ::close(write_handle_);
    }
    read_handle_ = invalid_handle();
    write_handle_ = invalid_handle();
}

} // namespace dazmcp
