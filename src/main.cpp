// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file main.cpp
/// @brief dazmcp-server: exposes DAZ Studio scripts as MCP tools

#include <dazmcp/dazmcp.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <thread>

namespace
{

int run_stdio(dazmcp::MethodRouter& router)
{
    dazmcp::StdioServer server(router);
    server.run();
    return 0;
}

int run_tcp(dazmcp::MethodRouter& router, const dazmcp::ServerConfig& config)
{
    // SIGINT/SIGTERM are taken by a watcher thread; every other thread keeps them blocked
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    auto framing = config.mode == dazmcp::TransportMode::Tcp ? dazmcp::Framing::ContentLength
                                                             : dazmcp::Framing::WebSocket;
    dazmcp::TcpServer server(router, config.host, config.port, framing);
    try
    {
        server.listen();
    }
    catch (const dazmcp::TransportError& e)
    {
        dazmcp::logger().critical("Cannot listen on {}:{}: {}", config.host, config.port, e.what());
        return 1;
    }

    // Whichever side gets here first owns the shutdown
    std::atomic<bool> stopping{false};
    std::thread watcher(
        [&]
        {
            int received = 0;
            sigwait(&stop_signals, &received);
            if (stopping.exchange(true))
                return;
            dazmcp::logger().info("Received signal {}, shutting down", received);
            server.stop();
        }
    );

    server.run();

    if (!stopping.exchange(true))
        pthread_kill(watcher.native_handle(), SIGTERM);
    watcher.join();
    server.stop();

    dazmcp::logger().info("Server stopped");
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    const std::string program = argc > 0 ? argv[0] : "dazmcp-server";

    dazmcp::ServerConfig config;
    try
    {
        config = dazmcp::ServerConfig::from_env();
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    try
    {
        switch (dazmcp::parse_command_line(argc, argv, config))
        {
        case dazmcp::CommandLineAction::ShowHelp:
            std::cout << dazmcp::usage(program);
            return 0;
        case dazmcp::CommandLineAction::ShowVersion:
            std::cout << dazmcp::kServerName << " " << dazmcp::kServerVersion << "\n";
            return 0;
        case dazmcp::CommandLineAction::Run:
            break;
        }
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << "\n\n" << dazmcp::usage(program);
        return 2;
    }

    dazmcp::init_logging(config.log_level);
    std::signal(SIGPIPE, SIG_IGN);

    if (!dazmcp::find_executable(config.executable))
        dazmcp::logger().warn(
            "Renderer executable '{}' not found; tool calls will fail to launch", config.executable
        );

    dazmcp::logger().info(
        "Scripts from '{}', call timeout {}s",
        config.script_root,
        static_cast<long long>(config.call_timeout.count())
    );

    try
    {
        auto registry = dazmcp::default_registry();
        dazmcp::ProcessRunner runner(config.runner_options());
        dazmcp::ToolInvoker invoker(registry, runner);

        dazmcp::RouterOptions router_options;
        router_options.legacy_methods = config.legacy_methods;
        dazmcp::MethodRouter router(invoker, router_options);

        if (config.mode == dazmcp::TransportMode::Stdio)
            return run_stdio(router);
        return run_tcp(router, config);
    }
    catch (const std::exception& e)
    {
        dazmcp::logger().critical("Fatal error: {}", e.what());
        return 1;
    }
}
