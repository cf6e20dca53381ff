// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <dazmcp/jsonrpc.hpp>
#include <dazmcp/tools.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dazmcp
{

/// Options for MethodRouter
struct RouterOptions
{
    /// Register loadScene / setPose / render as aliases of tools/call
    bool legacy_methods = false;
};

/// Handler for a method that answers (returns the result or throws)
using MethodHandler = std::function<json(const json& params)>;

/// Handler for a notification (nothing is sent back)
using NotificationHandler = std::function<void(const json& params)>;

/// Routes parsed JSON-RPC messages to the MCP method handlers
///
/// One instance serves every connection of both bindings. It holds no
/// per-request state, so concurrent calls from several connections are safe.
///
/// Methods:
/// - initialize, tools/list, tools/call, resources/list, prompts/list
/// - notifications/initialized (notification only)
/// - loadScene, setPose, render when RouterOptions::legacy_methods is set
class MethodRouter
{
  public:
    /// @param invoker Must outlive the router
    explicit MethodRouter(ToolInvoker& invoker, RouterOptions options = {});

    /// Full per-message step: decode, dispatch, encode
    ///
    /// Never throws. Returns the encoded response, or nullopt when the message
    /// was a notification and nothing may be written back.
    std::optional<std::string> process(const std::string& text);

    /// Dispatch an already decoded message
    /// @return nullopt for notifications
    std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& request);

    /// True if `method` is answered as a request
    bool has_method(const std::string& method) const;

    /// Registered request method names, sorted
    std::vector<std::string> methods() const;

  private:
    void add_method(const std::string& name, MethodHandler handler);
    void add_notification(const std::string& name, NotificationHandler handler);
    void add_legacy_alias(const std::string& method, const std::string& tool);

    json handle_initialize(const json& params) const;
    json handle_tools_list() const;
    json handle_tools_call(const json& params);

    ToolInvoker& invoker_;
    RouterOptions options_;
    std::map<std::string, MethodHandler> methods_;
    std::map<std::string, NotificationHandler> notifications_;
};

} // namespace dazmcp
