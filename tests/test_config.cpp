// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <dazmcp/config.hpp>
#include <dazmcp/logging.hpp>
#include <gtest/gtest.h>

using namespace dazmcp;

// =============================================================================
// Environment Tests
// =============================================================================

/// Clears every variable the server reads before and after each test
class ServerConfigTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        clear();
    }

    void TearDown() override
    {
        clear();
    }

    static void clear()
    {
        for (const char* name :
             {ServerConfig::ENV_HOST,
              ServerConfig::ENV_PORT,
              ServerConfig::ENV_EXECUTABLE,
              ServerConfig::ENV_SCRIPT_ROOT,
              ServerConfig::ENV_LOG_LEVEL,
              ServerConfig::ENV_CALL_TIMEOUT,
              ServerConfig::ENV_LEGACY_METHODS})
            unsetenv(name);
    }
};

TEST_F(ServerConfigTest, Defaults)
{
    auto config = ServerConfig::from_env();

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8765);
    EXPECT_EQ(config.executable, "dazstudio");
    EXPECT_EQ(config.script_root, "scripts");
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_EQ(config.call_timeout, std::chrono::seconds(60));
    EXPECT_FALSE(config.legacy_methods);
    EXPECT_EQ(config.mode, TransportMode::WebSocket);
}

TEST_F(ServerConfigTest, ReadsEnvironment)
{
    setenv("HOST", "0.0.0.0", 1);
    setenv("PORT", "9000", 1);
    setenv("DAZ_EXE", "/opt/daz/DAZStudio", 1);
    setenv("DAZ_SCRIPT_PATH", "/opt/daz/scripts", 1);
    setenv("LOG_LEVEL", "DEBUG", 1);
    setenv("CALL_TIMEOUT", "120", 1);
    setenv("DAZ_LEGACY_METHODS", "yes", 1);

    auto config = ServerConfig::from_env();

    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.executable, "/opt/daz/DAZStudio");
    EXPECT_EQ(config.script_root, "/opt/daz/scripts");
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_EQ(config.call_timeout, std::chrono::seconds(120));
    EXPECT_TRUE(config.legacy_methods);
}

TEST_F(ServerConfigTest, EmptyValuesKeepDefaults)
{
    setenv("PORT", "", 1);
    setenv("DAZ_EXE", "", 1);

    auto config = ServerConfig::from_env();

    EXPECT_EQ(config.port, 8765);
    EXPECT_EQ(config.executable, "dazstudio");
}

TEST_F(ServerConfigTest, InvalidPort)
{
    setenv("PORT", "http", 1);
    EXPECT_THROW(ServerConfig::from_env(), std::invalid_argument);

    setenv("PORT", "8765abc", 1);
    EXPECT_THROW(ServerConfig::from_env(), std::invalid_argument);

    setenv("PORT", "70000", 1);
    EXPECT_THROW(ServerConfig::from_env(), std::invalid_argument);
}

TEST_F(ServerConfigTest, InvalidTimeout)
{
    setenv("CALL_TIMEOUT", "0", 1);
    EXPECT_THROW(ServerConfig::from_env(), std::invalid_argument);

    setenv("CALL_TIMEOUT", "-5", 1);
    EXPECT_THROW(ServerConfig::from_env(), std::invalid_argument);
}

TEST_F(ServerConfigTest, ErrorNamesTheVariable)
{
    setenv("CALL_TIMEOUT", "soon", 1);
    try
    {
        ServerConfig::from_env();
        FAIL() << "Expected std::invalid_argument";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_NE(std::string(e.what()).find("CALL_TIMEOUT"), std::string::npos);
    }
}

TEST_F(ServerConfigTest, LegacyMethodsFlag)
{
    setenv("DAZ_LEGACY_METHODS", "0", 1);
    EXPECT_FALSE(ServerConfig::from_env().legacy_methods);

    setenv("DAZ_LEGACY_METHODS", "TRUE", 1);
    EXPECT_TRUE(ServerConfig::from_env().legacy_methods);

    setenv("DAZ_LEGACY_METHODS", "maybe", 1);
    EXPECT_THROW(ServerConfig::from_env(), std::invalid_argument);
}

TEST_F(ServerConfigTest, RunnerOptions)
{
    setenv("DAZ_EXE", "/usr/local/bin/dazstudio", 1);
    setenv("DAZ_SCRIPT_PATH", "/srv/scripts", 1);
    setenv("CALL_TIMEOUT", "15", 1);

    auto options = ServerConfig::from_env().runner_options();

    EXPECT_EQ(options.executable, "/usr/local/bin/dazstudio");
    EXPECT_EQ(options.script_root, "/srv/scripts");
    EXPECT_EQ(options.timeout, std::chrono::seconds(15));
}

// =============================================================================
// Command Line Tests
// =============================================================================

TEST(CommandLineTest, NoArguments)
{
    ServerConfig config;
    const char* argv[] = {"dazmcp-server"};

    EXPECT_EQ(parse_command_line(1, argv, config), CommandLineAction::Run);
    EXPECT_EQ(config.mode, TransportMode::WebSocket);
}

TEST(CommandLineTest, StdioMode)
{
    ServerConfig config;
    const char* argv[] = {"dazmcp-server", "--stdio"};

    EXPECT_EQ(parse_command_line(2, argv, config), CommandLineAction::Run);
    EXPECT_EQ(config.mode, TransportMode::Stdio);
}

TEST(CommandLineTest, FramedTcpMode)
{
    ServerConfig config;
    const char* argv[] = {"dazmcp-server", "--tcp"};

    EXPECT_EQ(parse_command_line(2, argv, config), CommandLineAction::Run);
    EXPECT_EQ(config.mode, TransportMode::Tcp);
}

TEST(CommandLineTest, HelpAndVersion)
{
    ServerConfig config;
    const char* help[] = {"dazmcp-server", "-h"};
    const char* version[] = {"dazmcp-server", "--version"};

    EXPECT_EQ(parse_command_line(2, help, config), CommandLineAction::ShowHelp);
    EXPECT_EQ(parse_command_line(2, version, config), CommandLineAction::ShowVersion);
}

TEST(CommandLineTest, UnknownOption)
{
    ServerConfig config;
    const char* argv[] = {"dazmcp-server", "--pipe"};

    EXPECT_THROW(parse_command_line(2, argv, config), std::invalid_argument);
}

TEST(CommandLineTest, UsageMentionsEnvironment)
{
    auto text = usage("dazmcp-server");

    EXPECT_NE(text.find("--stdio"), std::string::npos);
    EXPECT_NE(text.find("--tcp"), std::string::npos);
    EXPECT_NE(text.find("ws://"), std::string::npos);
    EXPECT_NE(text.find("DAZ_EXE"), std::string::npos);
    EXPECT_NE(text.find("CALL_TIMEOUT"), std::string::npos);
}

// =============================================================================
// Logging Tests
// =============================================================================

TEST(LoggingTest, ParseLogLevel)
{
    EXPECT_EQ(parse_log_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("WARNING"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("Error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("CRITICAL"), spdlog::level::critical);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_EQ(parse_log_level("verbose"), spdlog::level::info);
}

TEST(LoggingTest, InitLoggingSetsLevel)
{
    init_logging("ERROR");
    EXPECT_EQ(logger().level(), spdlog::level::err);
    EXPECT_EQ(logger().name(), "dazmcp");

    init_logging("INFO");
    EXPECT_EQ(logger().level(), spdlog::level::info);
}
