// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/config.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace dazmcp
{

namespace
{

std::optional<std::string> env_value(const char* name)
{
    const char* value = std::getenv(name);
    if (value != nullptr && value[0] != '\0')
        return std::string(value);
    return std::nullopt;
}

int parse_int(const char* name, const std::string& text, int min_value, int max_value)
{
    size_t consumed = 0;
    int value = 0;
    try
    {
        value = std::stoi(text, &consumed);
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text + "'");
    }
    if (consumed != text.size())
        throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text + "'");
    if (value < min_value || value > max_value)
        throw std::invalid_argument(
            std::string(name) + " must be between " + std::to_string(min_value) + " and " +
            std::to_string(max_value) + ", got " + text
        );
    return value;
}

bool parse_bool(const char* name, const std::string& text)
{
    std::string lower = text;
    std::transform(
        lower.begin(),
        lower.end(),
        lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
    );
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
        return false;
    throw std::invalid_argument(std::string(name) + " must be a boolean, got '" + text + "'");
}

} // namespace

ServerConfig ServerConfig::from_env()
{
    ServerConfig config;

    if (auto host = env_value(ENV_HOST))
        config.host = *host;
    if (auto port = env_value(ENV_PORT))
        config.port = parse_int(ENV_PORT, *port, 0, 65535);
    if (auto exe = env_value(ENV_EXECUTABLE))
        config.executable = *exe;
    if (auto root = env_value(ENV_SCRIPT_ROOT))
        config.script_root = *root;
    if (auto level = env_value(ENV_LOG_LEVEL))
        config.log_level = *level;
    if (auto timeout = env_value(ENV_CALL_TIMEOUT))
        config.call_timeout = std::chrono::seconds(parse_int(ENV_CALL_TIMEOUT, *timeout, 1, 86400));
    if (auto legacy = env_value(ENV_LEGACY_METHODS))
        config.legacy_methods = parse_bool(ENV_LEGACY_METHODS, *legacy);

    return config;
}

CommandLineAction parse_command_line(int argc, const char* const* argv, ServerConfig& config)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--stdio")
            config.mode = TransportMode::Stdio;
        else if (arg == "--tcp")
            config.mode = TransportMode::Tcp;
        else if (arg == "--help" || arg == "-h")
            return CommandLineAction::ShowHelp;
        else if (arg == "--version")
            return CommandLineAction::ShowVersion;
        else
            throw std::invalid_argument("Unknown option: " + arg);
    }
    return CommandLineAction::Run;
}

std::string usage(const std::string& program)
{
    return "Usage: " + program +
           " [--stdio | --tcp] [--help] [--version]\n"
           "\n"
           "Serves DAZ Studio scripts as MCP tools over JSON-RPC 2.0.\n"
           "\n"
           "Options:\n"
           "  --stdio     Line-delimited JSON-RPC on stdin/stdout\n"
           "  --tcp       Content-Length framed JSON-RPC on HOST:PORT\n"
           "              (default: WebSocket on ws://HOST:PORT/)\n"
           "  --help      Show this message\n"
           "  --version   Show the server version\n"
           "\n"
           "Environment:\n"
           "  HOST                 Listen address (127.0.0.1)\n"
           "  PORT                 Listen port (8765)\n"
           "  DAZ_EXE              Renderer executable (dazstudio)\n"
           "  DAZ_SCRIPT_PATH      Directory containing the .dsa scripts (scripts)\n"
           "  LOG_LEVEL            DEBUG, INFO, WARNING or ERROR (INFO)\n"
           "  CALL_TIMEOUT         Per-call timeout in seconds (60)\n"
           "  DAZ_LEGACY_METHODS   Accept loadScene/setPose/render (0)\n";
}

} // namespace dazmcp
