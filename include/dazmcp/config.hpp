// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <dazmcp/process_runner.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dazmcp
{

/// Which binding the server runs
enum class TransportMode
{
    WebSocket,
    Tcp,
    Stdio
};

/// Startup configuration, read once and handed to each component
struct ServerConfig
{
    // Environment variable names
    static constexpr const char* ENV_HOST = "HOST";
    static constexpr const char* ENV_PORT = "PORT";
    static constexpr const char* ENV_EXECUTABLE = "DAZ_EXE";
    static constexpr const char* ENV_SCRIPT_ROOT = "DAZ_SCRIPT_PATH";
    static constexpr const char* ENV_LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* ENV_CALL_TIMEOUT = "CALL_TIMEOUT";
    static constexpr const char* ENV_LEGACY_METHODS = "DAZ_LEGACY_METHODS";

    std::string host = "127.0.0.1";
    int port = 8765;
    std::string executable = "dazstudio";
    std::string script_root = "scripts";
    std::string log_level = "INFO";
    std::chrono::seconds call_timeout{60};

    /// Accept the deprecated loadScene / setPose / render methods
    bool legacy_methods = false;

    TransportMode mode = TransportMode::WebSocket;

    /// Defaults overridden by whatever is set in the environment
    /// @throws std::invalid_argument on malformed numeric or boolean values
    static ServerConfig from_env();

    /// Settings for the ProcessRunner
    ProcessRunnerOptions runner_options() const
    {
        ProcessRunnerOptions options;
        options.executable = executable;
        options.script_root = script_root;
        options.timeout = call_timeout;
        return options;
    }
};

/// What main should do after the command line has been read
enum class CommandLineAction
{
    Run,
    ShowHelp,
    ShowVersion
};

/// Apply command-line options to `config`
///
/// Recognised: `--stdio`, `--tcp`, `--help`/`-h`, `--version`.
/// @throws std::invalid_argument for unknown options
CommandLineAction parse_command_line(int argc, const char* const* argv, ServerConfig& config);

/// Usage text for `--help`
std::string usage(const std::string& program);

} // namespace dazmcp
