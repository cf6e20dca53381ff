// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <dazmcp/router.hpp>
#include <dazmcp/transport.hpp>
#include <dazmcp/transport_tcp.hpp>

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dazmcp
{

/// Read, dispatch and answer messages on one channel until it closes
///
/// Messages are handled strictly one at a time: the next message is not read
/// before the previous response has been written. Only the channel ending
/// (ConnectionClosedError) or failing (TransportError) stops the loop. An
/// oversized message the channel could skip (MessageTooLargeError) is answered
/// with a parse error and the loop goes on.
/// @return Number of messages processed
size_t serve_channel(IMessageChannel& channel, MethodRouter& router);

// =============================================================================
// Stdio binding
// =============================================================================

/// Line-delimited JSON-RPC over the process's stdin/stdout
class StdioServer
{
  public:
    /// @param router Must outlive the server
    /// @param read_fd / write_fd default to the process's own stdin / stdout
    explicit StdioServer(MethodRouter& router, int read_fd = 0, int write_fd = 1)
        : router_(router), read_fd_(read_fd), write_fd_(write_fd)
    {
    }

    /// Serve until end of input
    void run();

  private:
    MethodRouter& router_;
    int read_fd_;
    int write_fd_;
};

// =============================================================================
// Duplex binding
// =============================================================================

/// How messages are delimited on an accepted connection
enum class Framing
{
    WebSocket,    ///< One text frame per message (ws://host:port/)
    ContentLength ///< Content-Length headers over the raw socket
};

/// JSON-RPC on host:port, one thread per client
class TcpServer
{
  public:
    /// @param router Must outlive the server
    TcpServer(
        MethodRouter& router, std::string host, int port, Framing framing = Framing::WebSocket
    );
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    /// Bind and listen; call before run() / start()
    /// @throws TransportError if the address cannot be bound
    void listen();

    /// Accept clients on the calling thread until stop() is called
    void run();

    /// run() on a background thread (listen() must have been called)
    void start();

    /// Stop accepting, shut down every live connection and join all threads
    void stop();

    /// Port actually bound (valid after listen())
    int port() const
    {
        return listener_.local_port();
    }

    /// Number of connections currently being served
    size_t active_connections() const;

  private:
    struct Connection
    {
        std::shared_ptr<TcpTransport> transport;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void reap_finished();
    size_t serve_connection(TcpTransport& transport);

    MethodRouter& router_;
    std::string host_;
    int port_;
    Framing framing_;
    TcpListener listener_;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex connections_mutex_;
    std::list<Connection> connections_;
};

} // namespace dazmcp
