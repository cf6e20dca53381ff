// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dazmcp
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

/// Serialize to a single line; invalid UTF-8 (e.g. raw process output) is replaced
inline std::string dump_json(const json& j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// =============================================================================
// Protocol Constants
// =============================================================================

/// MCP protocol version reported when the client does not state one
inline constexpr const char* kDefaultProtocolVersion = "2025-06-18";

/// Server identity reported by initialize
inline constexpr const char* kServerName = "daz-studio-mcp";
inline constexpr const char* kServerVersion = "1.3.0";

/// Reason attached to a ProcessResult whose process exceeded the call timeout
inline constexpr const char* kTimeoutReason = "timeout";

/// Reason attached to a ProcessResult whose process could not be started
inline constexpr const char* kLaunchFailedReason = "launch_failed";

// =============================================================================
// Tool Descriptor
// =============================================================================

/// Static metadata advertising one callable tool (served by tools/list)
struct ToolDescriptor
{
    std::string name;
    std::string description;
    json input_schema;
};

inline void to_json(json& j, const ToolDescriptor& d)
{
    j = json{{"name", d.name}, {"description", d.description}, {"inputSchema", d.input_schema}};
}

inline void from_json(const json& j, ToolDescriptor& d)
{
    j.at("name").get_to(d.name);
    j.at("description").get_to(d.description);
    if (j.contains("inputSchema"))
        d.input_schema = j.at("inputSchema");
}

// =============================================================================
// Process Result
// =============================================================================

/// Outcome classification of one external process invocation
enum class ProcessStatus
{
    Ok,
    Error
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ProcessStatus,
    {
        {ProcessStatus::Ok, "ok"},
        {ProcessStatus::Error, "error"},
    }
)

/// Result of running a renderer script
///
/// `status` is Ok iff the process launched and exited with code 0.
/// Failed outcomes carry either a `returncode` (the process ran and exited
/// non-zero) or a `reason` (kTimeoutReason / kLaunchFailedReason).
struct ProcessResult
{
    ProcessStatus status = ProcessStatus::Error;
    std::optional<int> returncode;
    std::optional<std::string> reason;
    std::optional<int> timeout_s; // set with kTimeoutReason
    std::string stdout_text;
    std::string stderr_text;
    int64_t duration_ms = 0;

    bool ok() const
    {
        return status == ProcessStatus::Ok;
    }

    bool timed_out() const
    {
        return reason.has_value() && *reason == kTimeoutReason;
    }
};

inline void to_json(json& j, const ProcessResult& r)
{
    j = json{{"status", r.status}};
    if (r.reason)
        j["reason"] = *r.reason;
    if (r.timeout_s)
        j["timeout_s"] = *r.timeout_s;
    if (r.returncode)
        j["returncode"] = *r.returncode;
    j["stdout"] = r.stdout_text;
    j["stderr"] = r.stderr_text;
    j["duration_ms"] = r.duration_ms;
}

inline void from_json(const json& j, ProcessResult& r)
{
    j.at("status").get_to(r.status);
    if (j.contains("returncode"))
        r.returncode = j.at("returncode").get<int>();
    if (j.contains("reason"))
        r.reason = j.at("reason").get<std::string>();
    if (j.contains("timeout_s"))
        r.timeout_s = j.at("timeout_s").get<int>();
    r.stdout_text = j.value("stdout", "");
    r.stderr_text = j.value("stderr", "");
    r.duration_ms = j.value("duration_ms", int64_t{0});
}

} // namespace dazmcp
