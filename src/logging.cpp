// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/logging.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dazmcp
{

namespace
{

constexpr const char* kLogPattern = "%Y-%m-%d %H:%M:%S.%e | %l | %n | %v";

std::shared_ptr<spdlog::logger> make_logger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto instance = std::make_shared<spdlog::logger>("dazmcp", std::move(sink));
    instance->set_pattern(kLogPattern);
    instance->set_level(spdlog::level::info);
    return instance;
}

} // namespace

spdlog::logger& logger()
{
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

spdlog::level::level_enum parse_log_level(const std::string& name)
{
    std::string lower = name;
    std::transform(
        lower.begin(),
        lower.end(),
        lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
    );

    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warning" || lower == "warn")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical" || lower == "fatal")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const std::string& level)
{
    auto& log = logger();
    log.set_level(parse_log_level(level));
    log.flush_on(spdlog::level::warn);
}

} // namespace dazmcp
