// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dazmcp
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Exception thrown when transport operations fail
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when a single message exceeds the size limit
///
/// The offending input has already been skipped, so the channel can keep
/// reading with the next message.
class MessageTooLargeError : public TransportError
{
  public:
    explicit MessageTooLargeError(const std::string& message) : TransportError(message) {}
};

/// Exception thrown when connection is closed or input is exhausted
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

/// Largest message any channel accepts by default (16 MiB)
constexpr size_t kMaxMessageSize = 16 * 1024 * 1024;

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O transport
///
/// Implementations provide the underlying byte stream (stdio descriptors, TCP
/// sockets, etc.) The transport is responsible for reading/writing raw bytes;
/// framing is handled separately by MessageFramer / LineFramer.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes into buffer
    /// @param buffer Destination buffer
    /// @param size Maximum bytes to read
    /// @return Number of bytes actually read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes to the transport
    /// @param data Source data
    /// @param size Number of bytes to write
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport
    virtual void close() = 0;

    /// Check if transport is open
    virtual bool is_open() const = 0;

    // Convenience overloads
    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }

    void write(const std::vector<char>& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Message Channel Interface
// =============================================================================

/// One complete message in, one complete message out
///
/// This is the only capability the server loop needs from a binding, so the
/// duplex and stream bindings share one dispatch path.
class IMessageChannel
{
  public:
    virtual ~IMessageChannel() = default;

    /// Block until one complete message is available
    /// @throws ConnectionClosedError at end of input
    /// @throws TransportError on read failure or invalid framing
    virtual std::string read_message() = 0;

    /// Write one complete message; returns once it has been handed to the OS
    /// @throws TransportError on write failure
    virtual void write_message(const std::string& message) = 0;

    /// Check if the underlying transport is still open
    virtual bool is_open() const = 0;
};

// =============================================================================
// Buffered line reader shared by both framers
// =============================================================================

namespace detail
{

class LineReader
{
  public:
    LineReader(ITransport& transport, size_t max_line_size)
        : transport_(transport), max_line_size_(max_line_size)
    {
    }

    /// Read a single line (up to \r\n or \n), terminator stripped
    /// @return nullopt if EOF is reached before any byte of the line
    /// @throws ConnectionClosedError if EOF is reached mid-line and
    ///         `allow_partial` is false
    /// @throws MessageTooLargeError if the line is longer than the limit; the
    ///         rest of the line is discarded first
    std::optional<std::string> read_line(bool allow_partial);

    /// Read exactly n bytes, consuming buffered data first
    void read_exact(char* buffer, size_t n);

  private:
    ITransport& transport_;
    size_t max_line_size_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;

    /// Ensure buffer has at least n bytes available (fewer on EOF)
    void fill_buffer(size_t min_bytes);

    /// Consume input up to and including the next newline (or EOF)
    void skip_line();
};

inline std::optional<std::string> LineReader::read_line(bool allow_partial)
{
    std::string line;
    bool any = false;

    while (true)
    {
        // Refill buffer if empty
        if (buffer_pos_ >= buffer_len_)
        {
            fill_buffer(1);
            if (buffer_len_ == 0)
            {
                if (!any)
                    return std::nullopt;
                if (!allow_partial)
                    throw ConnectionClosedError("Connection closed while reading header");
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                return line;
            }
        }

        char c = buffer_[buffer_pos_++];
        any = true;

        if (c == '\n')
        {
            // Remove trailing \r if present
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        if (line.size() >= max_line_size_)
        {
            skip_line();
            throw MessageTooLargeError(
                "Line exceeds " + std::to_string(max_line_size_) + " bytes"
            );
        }
        line += c;
    }
}

inline void LineReader::skip_line()
{
    while (true)
    {
        if (buffer_pos_ >= buffer_len_)
        {
            fill_buffer(1);
            if (buffer_len_ == 0)
                return;
        }
        if (buffer_[buffer_pos_++] == '\n')
            return;
    }
}

inline void LineReader::read_exact(char* buffer, size_t n)
{
    size_t total_read = 0;

    // First, use any buffered data
    while (total_read < n && buffer_pos_ < buffer_len_)
        buffer[total_read++] = buffer_[buffer_pos_++];

    // Read remaining directly from transport
    while (total_read < n)
    {
        size_t bytes_read = transport_.read(buffer + total_read, n - total_read);
        if (bytes_read == 0)
            throw ConnectionClosedError("Connection closed while reading message body");
        total_read += bytes_read;
    }
}

inline void LineReader::fill_buffer(size_t min_bytes)
{
    // Compact buffer if needed
    if (buffer_pos_ > 0)
    {
        if (buffer_pos_ < buffer_len_)
        {
            std::copy(
                buffer_.begin() + buffer_pos_, buffer_.begin() + buffer_len_, buffer_.begin()
            );
            buffer_len_ -= buffer_pos_;
        }
        else
        {
            buffer_len_ = 0;
        }
        buffer_pos_ = 0;
    }

    // Ensure buffer is large enough
    constexpr size_t kMinBufferSize = 4096;
    if (buffer_.size() < kMinBufferSize)
        buffer_.resize(kMinBufferSize);

    // Read more data
    while (buffer_len_ < min_bytes)
    {
        size_t bytes_read =
            transport_.read(buffer_.data() + buffer_len_, buffer_.size() - buffer_len_);

        if (bytes_read == 0)
        {
            // EOF - return what we have
            return;
        }

        buffer_len_ += bytes_read;
    }
}

} // namespace detail

// =============================================================================
// Content-Length Message Framer (duplex channel)
// =============================================================================

/// Handles Content-Length header framing for JSON-RPC messages
///
/// Message format:
/// ```
/// Content-Length: <length>\r\n
/// \r\n
/// <json-rpc-message>
/// ```
///
/// Used on TCP connections, where a byte stream has to carry discrete frames.
class MessageFramer : public IMessageChannel
{
  public:
    /// @param max_message_size Largest body accepted; also caps header lines
    explicit MessageFramer(ITransport& transport, size_t max_message_size = kMaxMessageSize)
        : transport_(transport), reader_(transport, max_message_size),
          max_message_size_(max_message_size)
    {
    }

    /// Read a complete framed message
    /// @return The message content (without headers)
    /// @throws TransportError on read failure, invalid framing or a
    ///         Content-Length above the limit
    /// @throws ConnectionClosedError if connection is closed
    std::string read_message() override;

    /// Write a message with Content-Length framing
    /// @param message The message content to send
    /// @throws TransportError on write failure
    void write_message(const std::string& message) override;

    bool is_open() const override
    {
        return transport_.is_open();
    }

  private:
    ITransport& transport_;
    detail::LineReader reader_;
    size_t max_message_size_;

    size_t parse_content_length(std::string value) const;
};

inline size_t MessageFramer::parse_content_length(std::string value) const
{
    size_t end = value.find_last_not_of(" \t");
    value.erase(end == std::string::npos ? 0 : end + 1);

    // Digits only: stoull would accept a sign and wrap "-1" around
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
        throw TransportError("Invalid Content-Length value: " + value);

    unsigned long long length = 0;
    try
    {
        length = std::stoull(value);
    }
    catch (const std::out_of_range&)
    {
        throw TransportError("Content-Length out of range: " + value);
    }

    if (length > max_message_size_)
        throw TransportError(
            "Content-Length " + value + " exceeds limit of " + std::to_string(max_message_size_)
        );
    return static_cast<size_t>(length);
}

inline std::string MessageFramer::read_message()
{
    // Read headers until empty line
    std::optional<size_t> content_length;

    while (true)
    {
        std::optional<std::string> line;
        try
        {
            line = reader_.read_line(false);
        }
        catch (const MessageTooLargeError& e)
        {
            // The body length is unknown, so the stream cannot be resynchronised
            throw TransportError(std::string("Invalid header: ") + e.what());
        }
        if (!line)
            throw ConnectionClosedError();

        // Empty line signals end of headers
        if (line->empty())
            break;

        // Parse Content-Length header (case-insensitive)
        const std::string prefix = "content-length:";
        std::string lower_line = *line;
        for (auto& c : lower_line)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (lower_line.compare(0, prefix.size(), prefix) == 0)
        {
            auto value_str = line->substr(prefix.size());
            // Trim whitespace
            size_t start = value_str.find_first_not_of(" \t");
            if (start != std::string::npos)
                value_str = value_str.substr(start);
            content_length = parse_content_length(value_str);
        }
        // Ignore other headers (e.g., Content-Type)
    }

    if (!content_length)
        throw TransportError("Missing Content-Length header");

    // Read the message body
    std::string message(*content_length, '\0');
    reader_.read_exact(message.data(), *content_length);

    return message;
}

inline void MessageFramer::write_message(const std::string& message)
{
    std::string frame = "Content-Length: " + std::to_string(message.size()) + "\r\n\r\n" + message;
    transport_.write(frame);
}

// =============================================================================
// Line-Delimited Framer (stream channel)
// =============================================================================

/// One JSON object per line in each direction
///
/// Blank lines between messages are skipped. A final line without a
/// terminating newline is still delivered before end of input is reported.
class LineFramer : public IMessageChannel
{
  public:
    explicit LineFramer(ITransport& transport, size_t max_message_size = kMaxMessageSize)
        : transport_(transport), reader_(transport, max_message_size)
    {
    }

    /// @throws ConnectionClosedError at end of input
    /// @throws MessageTooLargeError for an over-long line, which is skipped
    std::string read_message() override
    {
        while (true)
        {
            auto line = reader_.read_line(true);
            if (!line)
                throw ConnectionClosedError("End of input");
            if (line->find_first_not_of(" \t") != std::string::npos)
                return *line;
        }
    }

    void write_message(const std::string& message) override
    {
        transport_.write(message + "\n");
    }

    bool is_open() const override
    {
        return transport_.is_open();
    }

  private:
    ITransport& transport_;
    detail::LineReader reader_;
};

} // namespace dazmcp
