// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/logging.hpp>
#include <dazmcp/router.hpp>

#include <stdexcept>

namespace dazmcp
{

MethodRouter::MethodRouter(ToolInvoker& invoker, RouterOptions options)
    : invoker_(invoker), options_(options)
{
    add_method("initialize", [this](const json& params) { return handle_initialize(params); });
    add_method("tools/list", [this](const json&) { return handle_tools_list(); });
    add_method("tools/call", [this](const json& params) { return handle_tools_call(params); });
    add_method("resources/list", [](const json&) { return json{{"resources", json::array()}}; });
    add_method("prompts/list", [](const json&) { return json{{"prompts", json::array()}}; });

    add_notification(
        "notifications/initialized",
        [](const json&) { logger().info("Client reported initialization complete"); }
    );

    if (options_.legacy_methods)
    {
        add_legacy_alias("loadScene", "load_scene");
        add_legacy_alias("setPose", "set_pose");
        add_legacy_alias("render", "render_scene");
    }
}

void MethodRouter::add_method(const std::string& name, MethodHandler handler)
{
    if (!methods_.emplace(name, std::move(handler)).second)
        throw std::logic_error("Duplicate method registration: " + name);
}

void MethodRouter::add_notification(const std::string& name, NotificationHandler handler)
{
    if (!notifications_.emplace(name, std::move(handler)).second)
        throw std::logic_error("Duplicate notification registration: " + name);
}

void MethodRouter::add_legacy_alias(const std::string& method, const std::string& tool)
{
    add_method(
        method,
        [this, method, tool](const json& params)
        {
            logger().warn("Deprecated method {} used; call tools/call with name {}", method, tool);
            return invoker_.call(tool, params);
        }
    );
}

bool MethodRouter::has_method(const std::string& method) const
{
    return methods_.count(method) != 0;
}

std::vector<std::string> MethodRouter::methods() const
{
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& entry : methods_)
        names.push_back(entry.first);
    return names;
}

// =============================================================================
// Dispatch
// =============================================================================

std::optional<std::string> MethodRouter::process(const std::string& text)
{
    json id = nullptr;
    bool notification = false;

    try
    {
        auto parsed = parse_message(text);
        if (!parsed.ok())
        {
            logger().error("Rejected message ({}): {}", parsed.error->message, text);
            return encode_error(parsed.id, parsed.error->code, parsed.error->message);
        }

        const auto& request = *parsed.request;
        notification = request.is_notification();
        if (request.id)
            id = *request.id;

        auto response = dispatch(request);
        if (!response)
            return std::nullopt;
        return dump_json(response->to_json());
    }
    catch (const std::exception& e)
    {
        logger().error("Error handling message: {}", e.what());
        if (notification)
            return std::nullopt;
        return encode_error(
            id, static_cast<int>(JsonRpcErrorCode::ServerError), std::string("Server error: ") + e.what()
        );
    }
}

std::optional<JsonRpcResponse> MethodRouter::dispatch(const JsonRpcRequest& request)
{
    if (request.is_notification())
    {
        auto it = notifications_.find(request.method);
        if (it == notifications_.end())
        {
            logger().debug("Ignoring notification {}", request.method);
            return std::nullopt;
        }

        try
        {
            it->second(request.params);
        }
        catch (const std::exception& e)
        {
            logger().error("Notification {} failed: {}", request.method, e.what());
        }
        return std::nullopt;
    }

    const json& id = *request.id;
    logger().debug("Dispatching {} (id={})", request.method, dump_json(id));

    auto it = methods_.find(request.method);
    if (it == methods_.end())
    {
        logger().warn("Method not found: {}", request.method);
        return JsonRpcResponse::failure(
            id, JsonRpcErrorCode::MethodNotFound, "Method not found: " + request.method
        );
    }

    try
    {
        return JsonRpcResponse::success(id, it->second(request.params));
    }
    catch (const JsonRpcError& e)
    {
        logger().warn("{} failed: {}", request.method, e.what());
        return JsonRpcResponse::failure(id, e.code(), e.what());
    }
    catch (const std::exception& e)
    {
        logger().error("Error handling {}: {}", request.method, e.what());
        return JsonRpcResponse::failure(
            id, JsonRpcErrorCode::ServerError, std::string("Server error: ") + e.what()
        );
    }
}

// =============================================================================
// MCP methods
// =============================================================================

json MethodRouter::handle_initialize(const json& params) const
{
    std::string version = kDefaultProtocolVersion;
    if (params.is_object())
    {
        auto it = params.find("protocolVersion");
        if (it != params.end() && it->is_string())
            version = it->get<std::string>();
    }

    logger().info("Client initializing (protocol {})", version);

    return json{
        {"protocolVersion", version},
        {"capabilities",
         {{"tools", json::object()}, {"resources", json::object()}, {"prompts", json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
    };
}

json MethodRouter::handle_tools_list() const
{
    return json{{"tools", invoker_.registry().descriptors()}};
}

json MethodRouter::handle_tools_call(const json& params)
{
    json name = nullptr;
    json arguments = nullptr;
    if (params.is_object())
    {
        name = params.value("name", json(nullptr));
        arguments = params.value("arguments", json(nullptr));
    }

    // A missing or non-string name is just another unknown tool
    std::string tool = name.is_string() ? name.get<std::string>() : dump_json(name);
    logger().info("tools/call {}", tool);
    return invoker_.call(tool, arguments);
}

} // namespace dazmcp
