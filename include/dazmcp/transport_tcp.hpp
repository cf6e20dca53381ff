// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <dazmcp/transport.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
// MSG_NOSIGNAL doesn't exist on macOS - use SO_NOSIGPIPE socket option instead
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace dazmcp
{

// =============================================================================
// TCP Transport
// =============================================================================

/// Transport that communicates over a connected TCP socket
class TcpTransport : public ITransport
{
  public:
    using Socket = int;
    static constexpr Socket kInvalidSocket = -1;

    /// Construct an unconnected transport
    TcpTransport() : socket_(kInvalidSocket), open_(false), eof_(false) {}

    /// Construct from an existing connected socket (takes ownership)
    explicit TcpTransport(Socket socket)
        : socket_(socket), open_(socket != kInvalidSocket), eof_(false)
    {
    }

    ~TcpTransport() override
    {
        close();
    }

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Movable
    TcpTransport(TcpTransport&& other) noexcept
        : socket_(other.socket_), open_(other.open_.load()), eof_(other.eof_.load())
    {
        other.socket_ = kInvalidSocket;
        other.open_ = false;
    }

    TcpTransport& operator=(TcpTransport&& other) noexcept
    {
        if (this != &other)
        {
            close();
            socket_ = other.socket_;
            open_ = other.open_.load();
            eof_ = other.eof_.load();
            other.socket_ = kInvalidSocket;
            other.open_ = false;
        }
        return *this;
    }

    /// Connect to a host:port
    /// @param host Hostname or IP address
    /// @param port Port number
    /// @param timeout_ms Connection timeout in milliseconds (0 = no timeout)
    /// @throws TransportError on connection failure
    void connect(const std::string& host, int port, int timeout_ms = 30000);

    size_t read(char* buffer, size_t size) override;
    using ITransport::write;
    void write(const char* data, size_t size) override;
    void close() override;

    /// Shut down both directions without releasing the descriptor
    ///
    /// Safe to call from another thread while a read is blocked; the blocked
    /// read returns EOF.
    void shutdown();

    /// False once closed or once the peer has closed its side
    bool is_open() const override
    {
        return open_ && !eof_;
    }

    Socket socket() const
    {
        return socket_;
    }

  private:
    Socket socket_;
    std::atomic<bool> open_;
    std::atomic<bool> eof_;

    static std::string get_socket_error();
    static Socket open_socket(const struct addrinfo* ai);
    void set_socket_blocking(bool blocking);
    static void set_socket_blocking(Socket sock, bool blocking);
    static void configure_socket(Socket sock);

    friend class TcpListener;
};

// =============================================================================
// TCP Listener
// =============================================================================

/// Listening socket that hands out one TcpTransport per accepted client
class TcpListener
{
  public:
    using Socket = TcpTransport::Socket;

    TcpListener() : socket_(TcpTransport::kInvalidSocket), open_(false), port_(0) {}

    ~TcpListener()
    {
        close();
    }

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /// Bind and listen on host:port
    /// @param port Port number (0 = pick an ephemeral port, see local_port())
    /// @throws TransportError if the address cannot be resolved or bound
    void listen(const std::string& host, int port, int backlog = 16);

    /// Block until a client connects
    /// @return Transport owning the accepted socket
    /// @throws ConnectionClosedError once the listener has been closed
    /// @throws TransportError on accept failure
    std::unique_ptr<TcpTransport> accept();

    /// Stop listening; a blocked accept() returns within one poll interval
    void close();

    bool is_open() const
    {
        return open_;
    }

    /// Port actually bound (useful when listen() was given port 0)
    int local_port() const
    {
        return port_;
    }

  private:
    std::atomic<Socket> socket_;
    std::atomic<bool> open_;
    int port_;

    static constexpr int kAcceptPollMs = 200;
};

// =============================================================================
// Implementation
// =============================================================================

inline std::string TcpTransport::get_socket_error()
{
    return strerror(errno);
}

/// Sockets are created close-on-exec so a renderer forked on another thread
/// never inherits one
inline TcpTransport::Socket TcpTransport::open_socket(const struct addrinfo* ai)
{
#if defined(__linux__)
    return ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
#else
    Socket sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock != kInvalidSocket)
        fcntl(sock, F_SETFD, FD_CLOEXEC);
    return sock;
#endif
}

inline void TcpTransport::set_socket_blocking(bool blocking)
{
    set_socket_blocking(socket_, blocking);
}

inline void TcpTransport::set_socket_blocking(Socket sock, bool blocking)
{
    int flags = fcntl(sock, F_GETFL, 0);
    if (blocking)
        fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
    else
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

inline void TcpTransport::configure_socket(Socket sock)
{
    // Disable Nagle's algorithm for lower latency
    int flag = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<char*>(&flag), sizeof(flag));

#if defined(__APPLE__)
    // On macOS, use SO_NOSIGPIPE to prevent SIGPIPE on send to closed socket
    setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &flag, sizeof(flag));
#endif
}

inline void TcpTransport::connect(const std::string& host, int port, int timeout_ms)
{
    // Close any existing connection
    close();

    // Resolve hostname
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);

    int status = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (status != 0)
        throw TransportError("getaddrinfo failed: " + std::string(gai_strerror(status)));

    // Try each address until we connect
    Socket sock = kInvalidSocket;
    for (auto* rp = result; rp != nullptr; rp = rp->ai_next)
    {
        sock = open_socket(rp);
        if (sock == kInvalidSocket)
            continue;

        // Set non-blocking for timeout support
        if (timeout_ms > 0)
            set_socket_blocking(sock, false);

        int connect_result = ::connect(sock, rp->ai_addr, rp->ai_addrlen);

        if (connect_result == 0)
        {
            // Connected immediately
            break;
        }

        bool would_block = (errno == EINPROGRESS);

        if (would_block && timeout_ms > 0)
        {
            // Wait for connection with timeout
            struct pollfd pfd{};
            pfd.fd = sock;
            pfd.events = POLLOUT;

            int poll_result = ::poll(&pfd, 1, timeout_ms);

            if (poll_result > 0)
            {
                // Check if connection succeeded
                int error = 0;
                socklen_t len = sizeof(error);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&error), &len);

                if (error == 0)
                {
                    // Connected successfully
                    break;
                }
            }
        }

        // Connection failed, try next address
        ::close(sock);
        sock = kInvalidSocket;
    }

    freeaddrinfo(result);

    if (sock == kInvalidSocket)
        throw TransportError("Failed to connect to " + host + ":" + std::to_string(port));

    // Restore blocking mode
    socket_ = sock;
    set_socket_blocking(true);
    configure_socket(socket_);

    eof_ = false;
    open_ = true;
}

inline size_t TcpTransport::read(char* buffer, size_t size)
{
    if (!open_ || eof_)
        throw ConnectionClosedError();

    ssize_t bytes_read;
    do
    {
        bytes_read = recv(socket_, buffer, size, 0);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == ECONNRESET || errno == EPIPE)
        {
            eof_ = true;
            return 0;
        }
        throw TransportError("recv failed: " + get_socket_error());
    }

    if (bytes_read == 0)
        eof_ = true;
    return static_cast<size_t>(bytes_read);
}

inline void TcpTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    size_t total_sent = 0;
    while (total_sent < size)
    {
        ssize_t bytes_sent = send(socket_, data + total_sent, size - total_sent, MSG_NOSIGNAL);
        if (bytes_sent < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE || errno == ECONNRESET)
                throw ConnectionClosedError("Connection closed by peer");
            throw TransportError("send failed: " + get_socket_error());
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }
}

inline void TcpTransport::shutdown()
{
    if (open_ && socket_ != kInvalidSocket)
        ::shutdown(socket_, SHUT_RDWR);
}

inline void TcpTransport::close()
{
    if (!open_.exchange(false))
        return;

    if (socket_ != kInvalidSocket)
    {
        ::shutdown(socket_, SHUT_RDWR);
        ::close(socket_);
        socket_ = kInvalidSocket;
    }
}

inline void TcpListener::listen(const std::string& host, int port, int backlog)
{
    close();

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    const char* node = host.empty() ? nullptr : host.c_str();

    int status = getaddrinfo(node, port_str.c_str(), &hints, &result);
    if (status != 0)
        throw TransportError("getaddrinfo failed: " + std::string(gai_strerror(status)));

    Socket sock = TcpTransport::kInvalidSocket;
    std::string last_error;
    for (auto* rp = result; rp != nullptr; rp = rp->ai_next)
    {
        sock = TcpTransport::open_socket(rp);
        if (sock == TcpTransport::kInvalidSocket)
        {
            last_error = TcpTransport::get_socket_error();
            continue;
        }

        int reuse = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if (::bind(sock, rp->ai_addr, rp->ai_addrlen) == 0 && ::listen(sock, backlog) == 0)
            break;

        last_error = TcpTransport::get_socket_error();
        ::close(sock);
        sock = TcpTransport::kInvalidSocket;
    }

    freeaddrinfo(result);

    if (sock == TcpTransport::kInvalidSocket)
        throw TransportError(
            "Failed to listen on " + host + ":" + std::to_string(port) + ": " + last_error
        );

    struct sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    port_ = port;
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0)
    {
        if (addr.ss_family == AF_INET)
            port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port);
        else if (addr.ss_family == AF_INET6)
            port_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port);
    }

    socket_ = sock;
    open_ = true;
}

inline std::unique_ptr<TcpTransport> TcpListener::accept()
{
    while (open_)
    {
        struct pollfd pfd{};
        pfd.fd = socket_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            throw TransportError("poll failed: " + TcpTransport::get_socket_error());
        }
        if (ready == 0 || !open_)
            continue;

#if defined(__linux__)
        Socket client = ::accept4(socket_, nullptr, nullptr, SOCK_CLOEXEC);
#else
        Socket client = ::accept(socket_, nullptr, nullptr);
        if (client != TcpTransport::kInvalidSocket)
            fcntl(client, F_SETFD, FD_CLOEXEC);
#endif
        if (client == TcpTransport::kInvalidSocket)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED)
                continue;
            if (!open_)
                break;
            throw TransportError("accept failed: " + TcpTransport::get_socket_error());
        }

        TcpTransport::configure_socket(client);
        return std::make_unique<TcpTransport>(client);
    }

    throw ConnectionClosedError("Listener closed");
}

inline void TcpListener::close()
{
    if (!open_.exchange(false))
        return;

    Socket sock = socket_.exchange(TcpTransport::kInvalidSocket);
    if (sock != TcpTransport::kInvalidSocket)
        ::close(sock);
}

} // namespace dazmcp
