// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <dazmcp/transport.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/websocket.hpp>

#include <string>

namespace dazmcp
{

// =============================================================================
// WebSocket Channel
// =============================================================================

/// One JSON-RPC message per WebSocket text frame
///
/// All I/O is synchronous and must stay on one thread. To interrupt a blocked
/// read from elsewhere, shut down the socket the channel was created from
/// (TcpTransport::shutdown); the read then reports ConnectionClosedError.
class WebSocketChannel : public IMessageChannel
{
  public:
    /// Unconnected channel, for connect()
    explicit WebSocketChannel(size_t max_message_size = kMaxMessageSize);

    /// Server side: work on a duplicate of an accepted socket
    ///
    /// The caller keeps ownership of `socket`; the channel closes only its
    /// own duplicate.
    /// @throws TransportError if the descriptor cannot be duplicated
    explicit WebSocketChannel(int socket, size_t max_message_size = kMaxMessageSize);

    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    /// Server side: answer the client's HTTP upgrade request
    /// @throws TransportError if the handshake fails
    void accept();

    /// Client side: connect to ws://host:port/ and perform the handshake
    /// @throws TransportError on connection or handshake failure
    void connect(const std::string& host, int port, const std::string& target = "/");

    /// @throws ConnectionClosedError once the peer closed or the socket was shut down
    /// @throws TransportError on read failure or an oversized frame
    std::string read_message() override;

    void write_message(const std::string& message) override;

    bool is_open() const override
    {
        return ws_.is_open();
    }

    /// Send a close frame and wait for the peer's reply
    void close();

  private:
    boost::asio::io_context ioc_;
    boost::beast::websocket::stream<boost::asio::ip::tcp::socket> ws_;
    size_t max_message_size_;
};

} // namespace dazmcp
