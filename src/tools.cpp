// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/logging.hpp>
#include <dazmcp/tools.hpp>

#include <stdexcept>

namespace dazmcp
{

// =============================================================================
// Tool table
// =============================================================================

ToolDescriptor ToolSpec::descriptor() const
{
    json properties = json::object();
    json required = json::array();
    for (const auto& param : params)
    {
        properties[param.name] = {{"type", param.type}, {"description", param.description}};
        if (param.required)
            required.push_back(param.name);
    }

    json schema = {{"type", "object"}, {"properties", properties}};
    if (!params.empty())
    {
        schema["required"] = required;
        schema["additionalProperties"] = false;
    }
    return ToolDescriptor{name, description, schema};
}

void ToolRegistry::add(ToolSpec spec)
{
    if (find(spec.name) != nullptr)
        throw std::invalid_argument("Duplicate tool name: " + spec.name);
    specs_.push_back(std::move(spec));
}

const ToolSpec* ToolRegistry::find(const std::string& name) const
{
    for (const auto& spec : specs_)
    {
        if (spec.name == name)
            return &spec;
    }
    return nullptr;
}

std::vector<ToolDescriptor> ToolRegistry::descriptors() const
{
    std::vector<ToolDescriptor> result;
    result.reserve(specs_.size());
    for (const auto& spec : specs_)
        result.push_back(spec.descriptor());
    return result;
}

ToolRegistry default_registry()
{
    ToolRegistry registry;

    registry.add({
        "load_scene",
        "Load a DAZ Studio scene file",
        "load_scene.dsa",
        {ToolParam::required_string("scene_path", "Path to the scene file to load")},
    });

    registry.add({
        "set_pose",
        "Set a pose for the selected figure",
        "set_pose.dsa",
        {
            ToolParam::required_string("pose_path", "Path to the pose file"),
            ToolParam::optional_string("figure_name", "Name of the figure to apply pose to"),
        },
    });

    registry.add({
        "render_scene",
        "Render the current scene",
        "render_scene.dsa",
        {
            ToolParam::required_string("output_path", "Path where to save the rendered image"),
            ToolParam::optional_integer("width", "Render width in pixels", 800),
            ToolParam::optional_integer("height", "Render height in pixels", 600),
        },
    });

    registry.add({
        "read_scene",
        "Get list of items in the current DAZ scene",
        "read_scene.dsa",
        {},
    });

    registry.add({
        "list_content",
        "List available items in the DAZ Studio content library",
        "list_content.dsa",
        {},
    });

    return registry;
}

// =============================================================================
// Result shaping
// =============================================================================

std::string argument_text(const json& value)
{
    if (value.is_null())
        return "";
    if (value.is_string())
        return value.get<std::string>();
    return dump_json(value);
}

json tool_error(const std::string& message, int code)
{
    return json{{"error", {{"message", message}, {"code", code}}}};
}

json normalize_result(const ProcessResult& result)
{
    if (result.ok())
    {
        json block = {{"type", "text"}, {"text", dump_json(json(result))}};
        return json{{"content", json::array({block})}};
    }

    std::string message = result.stderr_text;
    if (message.empty())
    {
        if (result.timed_out())
            message = "timeout: script exceeded call timeout of " +
                      std::to_string(result.timeout_s.value_or(0)) + "s";
        else if (result.returncode)
            message = "Script exited with code " + std::to_string(*result.returncode);
        else
            message = "Unknown error";
    }

    json error = tool_error(message, result.returncode.value_or(-1));
    if (result.reason)
        error["error"]["reason"] = *result.reason;
    if (result.timeout_s)
        error["error"]["timeout_s"] = *result.timeout_s;
    return error;
}

// =============================================================================
// ToolInvoker
// =============================================================================

std::optional<std::string> ToolInvoker::extract_arguments(
    const ToolSpec& spec, const json& arguments, std::vector<std::string>& out
) const
{
    if (!arguments.is_null() && !arguments.is_object())
        return "Invalid arguments for " + spec.name + ": expected an object";

    out.clear();
    out.reserve(spec.params.size());
    for (const auto& param : spec.params)
    {
        json value = param.default_value;
        if (arguments.is_object())
        {
            auto it = arguments.find(param.name);
            if (it != arguments.end() && !it->is_null())
                value = *it;
            else if (param.required)
                return "Missing required argument: " + param.name;
        }
        else if (param.required)
        {
            return "Missing required argument: " + param.name;
        }
        out.push_back(argument_text(value));
    }

    if (arguments.is_object())
    {
        for (const auto& item : arguments.items())
        {
            bool known = false;
            for (const auto& param : spec.params)
                known = known || param.name == item.key();
            if (!known)
                logger().debug("Ignoring unknown argument '{}' for tool {}", item.key(), spec.name);
        }
    }

    return std::nullopt;
}

json ToolInvoker::call(const std::string& name, const json& arguments)
{
    const ToolSpec* spec = registry_.find(name);
    if (spec == nullptr)
    {
        logger().warn("tools/call for unknown tool: {}", name);
        return tool_error("Unknown tool: " + name);
    }

    std::vector<std::string> args;
    if (auto problem = extract_arguments(*spec, arguments, args))
    {
        logger().warn("tools/call {} rejected: {}", name, *problem);
        return tool_error(*problem);
    }

    return normalize_result(runner_.run(spec->script, args));
}

} // namespace dazmcp
