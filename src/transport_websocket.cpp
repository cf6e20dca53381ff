// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/transport_websocket.hpp>

#include <boost/asio/connect.hpp>
#include <boost/beast/core.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace dazmcp
{

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace
{

/// Errors that mean the peer went away rather than something broke
bool is_disconnect(const beast::error_code& ec)
{
    return ec == websocket::error::closed || ec == net::error::eof ||
           ec == net::error::connection_reset || ec == net::error::broken_pipe ||
           ec == net::error::not_connected || ec == net::error::operation_aborted;
}

} // namespace

WebSocketChannel::WebSocketChannel(size_t max_message_size)
    : ws_(ioc_), max_message_size_(max_message_size)
{
    ws_.read_message_max(max_message_size_);
}

WebSocketChannel::WebSocketChannel(int socket, size_t max_message_size)
    : ws_(ioc_), max_message_size_(max_message_size)
{
    ws_.read_message_max(max_message_size_);

    int fd = ::fcntl(socket, F_DUPFD_CLOEXEC, 0);
    if (fd < 0)
        throw TransportError(std::string("Cannot duplicate socket: ") + std::strerror(errno));

    struct sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0)
    {
        int err = errno;
        ::close(fd);
        throw TransportError(std::string("getsockname failed: ") + std::strerror(err));
    }

    beast::error_code ec;
    ws_.next_layer().assign(addr.ss_family == AF_INET6 ? tcp::v6() : tcp::v4(), fd, ec);
    if (ec)
    {
        ::close(fd);
        throw TransportError("Cannot adopt socket: " + ec.message());
    }
}

WebSocketChannel::~WebSocketChannel() = default;

void WebSocketChannel::accept()
{
    beast::error_code ec;
    ws_.accept(ec);
    if (ec)
        throw TransportError("WebSocket handshake failed: " + ec.message());
    ws_.text(true);
}

void WebSocketChannel::connect(const std::string& host, int port, const std::string& target)
{
    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec)
        throw TransportError("Cannot resolve " + host + ": " + ec.message());

    net::connect(ws_.next_layer(), endpoints, ec);
    if (ec)
        throw TransportError(
            "Failed to connect to " + host + ":" + std::to_string(port) + ": " + ec.message()
        );

    ws_.handshake(host + ":" + std::to_string(port), target, ec);
    if (ec)
        throw TransportError("WebSocket handshake failed: " + ec.message());
    ws_.text(true);
}

std::string WebSocketChannel::read_message()
{
    beast::flat_buffer buffer;
    beast::error_code ec;
    ws_.read(buffer, ec);

    if (ec && is_disconnect(ec))
        throw ConnectionClosedError("WebSocket closed: " + ec.message());
    if (ec)
        throw TransportError("WebSocket read failed: " + ec.message());

    return beast::buffers_to_string(buffer.data());
}

void WebSocketChannel::write_message(const std::string& message)
{
    beast::error_code ec;
    ws_.write(net::buffer(message), ec);

    if (ec && is_disconnect(ec))
        throw ConnectionClosedError("WebSocket closed: " + ec.message());
    if (ec)
        throw TransportError("WebSocket write failed: " + ec.message());
}

void WebSocketChannel::close()
{
    if (!ws_.is_open())
        return;

    beast::error_code ec;
    ws_.close(websocket::close_code::normal, ec);
}

} // namespace dazmcp
