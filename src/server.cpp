// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/logging.hpp>
#include <dazmcp/server.hpp>
#include <dazmcp/transport_stdio.hpp>
#include <dazmcp/transport_websocket.hpp>

#include <iterator>

namespace dazmcp
{

namespace
{

/// Write one reply; false once the channel can no longer be written
bool send_reply(IMessageChannel& channel, const std::string& reply)
{
    try
    {
        logger().debug("Sending: {}", reply);
        channel.write_message(reply);
        return true;
    }
    catch (const TransportError& e)
    {
        logger().error("Transport write failed: {}", e.what());
        return false;
    }
}

} // namespace

size_t serve_channel(IMessageChannel& channel, MethodRouter& router)
{
    size_t processed = 0;

    while (true)
    {
        std::string message;
        try
        {
            message = channel.read_message();
        }
        catch (const ConnectionClosedError&)
        {
            break;
        }
        catch (const MessageTooLargeError& e)
        {
            logger().warn("Dropped message: {}", e.what());
            ++processed;
            auto reply = encode_error(
                nullptr,
                static_cast<int>(JsonRpcErrorCode::ParseError),
                std::string("Parse error: ") + e.what()
            );
            if (!send_reply(channel, reply))
                break;
            continue;
        }
        catch (const TransportError& e)
        {
            logger().error("Transport read failed: {}", e.what());
            break;
        }
        catch (const std::exception& e)
        {
            logger().error("Read failed: {}", e.what());
            break;
        }

        logger().debug("Received: {}", message);
        auto response = router.process(message);
        ++processed;

        if (response && !send_reply(channel, *response))
            break;
    }

    return processed;
}

// =============================================================================
// StdioServer
// =============================================================================

void StdioServer::run()
{
    StdioTransport transport(read_fd_, write_fd_, false);
    LineFramer framer(transport);

    logger().info("MCP DAZ server started in stdio mode");
    size_t processed = serve_channel(framer, router_);
    logger().info("End of input after {} message(s); stdio server exiting", processed);
}

// =============================================================================
// TcpServer
// =============================================================================

TcpServer::TcpServer(MethodRouter& router, std::string host, int port, Framing framing)
    : router_(router), host_(std::move(host)), port_(port), framing_(framing)
{
}

TcpServer::~TcpServer()
{
    stop();
}

void TcpServer::listen()
{
    listener_.listen(host_, port_);
    logger().info(
        "Starting MCP DAZ server on {}://{}:{}",
        framing_ == Framing::WebSocket ? "ws" : "tcp",
        host_,
        listener_.local_port()
    );
}

void TcpServer::run()
{
    if (!listener_.is_open())
        listen();

    running_ = true;
    while (running_)
    {
        std::unique_ptr<TcpTransport> client;
        try
        {
            client = listener_.accept();
        }
        catch (const ConnectionClosedError&)
        {
            break;
        }
        catch (const TransportError& e)
        {
            logger().error("Accept failed: {}", e.what());
            continue;
        }

        reap_finished();

        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (!running_)
            break;

        connections_.emplace_back();
        Connection& connection = connections_.back();
        connection.transport = std::shared_ptr<TcpTransport>(std::move(client));
        connection.thread = std::thread(
            [this, &connection, transport = connection.transport]
            {
                logger().info("Client connected");
                size_t processed = serve_connection(*transport);
                logger().info("Client disconnected after {} message(s)", processed);

                // Under the lock so stop() never shuts down a descriptor being closed
                std::lock_guard<std::mutex> done_lock(connections_mutex_);
                transport->close();
                connection.finished = true;
            }
        );
    }
    running_ = false;
}

size_t TcpServer::serve_connection(TcpTransport& transport)
{
    if (framing_ == Framing::ContentLength)
    {
        MessageFramer framer(transport);
        return serve_channel(framer, router_);
    }

    try
    {
        WebSocketChannel channel(transport.socket());
        channel.accept();
        return serve_channel(channel, router_);
    }
    catch (const TransportError& e)
    {
        logger().warn("Rejected connection: {}", e.what());
        return 0;
    }
}

void TcpServer::start()
{
    if (!listener_.is_open())
        listen();
    running_ = true;
    accept_thread_ = std::thread([this] { run(); });
}

void TcpServer::stop()
{
    running_ = false;
    listener_.close();

    if (accept_thread_.joinable() && accept_thread_.get_id() != std::this_thread::get_id())
        accept_thread_.join();

    std::list<Connection> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& connection : connections_)
            connection.transport->shutdown();
        remaining.splice(remaining.end(), connections_);
    }

    for (auto& connection : remaining)
    {
        if (connection.thread.joinable())
            connection.thread.join();
    }
}

size_t TcpServer::active_connections() const
{
    std::lock_guard<std::mutex> lock(connections_mutex_);
    size_t count = 0;
    for (const auto& connection : connections_)
    {
        if (!connection.finished)
            ++count;
    }
    return count;
}

void TcpServer::reap_finished()
{
    std::list<Connection> done;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();)
        {
            auto next = std::next(it);
            if (it->finished)
                done.splice(done.end(), connections_, it);
            it = next;
        }
    }

    for (auto& connection : done)
    {
        if (connection.thread.joinable())
            connection.thread.join();
    }
}

} // namespace dazmcp
