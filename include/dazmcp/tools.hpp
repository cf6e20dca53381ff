// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file tools.hpp
/// @brief Declarative tool table and the tools/call normalizer
///
/// Each tool maps to one renderer script. Its parameters are listed in the
/// order they are passed to the script as positional `-scriptArg` values,
/// and the same list produces the JSON schema advertised by tools/list.
///
/// @code
/// ToolRegistry registry;
/// registry.add({"render_scene", "Render the current scene", "render_scene.dsa",
///               {ToolParam::required_string("output_path", "Where to save the image"),
///                ToolParam::optional_integer("width", "Width in pixels", 800)}});
/// @endcode

#include <dazmcp/process_runner.hpp>
#include <dazmcp/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dazmcp
{

/// One tool argument
struct ToolParam
{
    std::string name;
    std::string type; // JSON schema type: "string", "integer", ...
    std::string description;
    bool required = false;
    json default_value; // used when an optional argument is absent

    static ToolParam required_string(std::string name, std::string description)
    {
        return ToolParam{std::move(name), "string", std::move(description), true, nullptr};
    }

    static ToolParam optional_string(
        std::string name, std::string description, std::string default_value = ""
    )
    {
        return ToolParam{
            std::move(name), "string", std::move(description), false, std::move(default_value)
        };
    }

    static ToolParam optional_integer(std::string name, std::string description, int default_value)
    {
        return ToolParam{std::move(name), "integer", std::move(description), false, default_value};
    }
};

/// One row of the tool table
struct ToolSpec
{
    std::string name;
    std::string description;
    std::string script;
    std::vector<ToolParam> params;

    /// Descriptor with the generated input schema
    ToolDescriptor descriptor() const;
};

/// Ordered, name-unique tool table; read-only once the server starts
class ToolRegistry
{
  public:
    /// @throws std::invalid_argument if a tool with the same name exists
    void add(ToolSpec spec);

    /// @return nullptr if no tool has this name
    const ToolSpec* find(const std::string& name) const;

    /// Descriptors in registration order
    std::vector<ToolDescriptor> descriptors() const;

    const std::vector<ToolSpec>& specs() const
    {
        return specs_;
    }

    size_t size() const
    {
        return specs_.size();
    }

  private:
    std::vector<ToolSpec> specs_;
};

/// The five DAZ Studio tools:
/// load_scene, set_pose, render_scene, read_scene, list_content
ToolRegistry default_registry();

/// Text handed to the script for one argument value
/// (strings as-is, null as empty, anything else in JSON notation)
std::string argument_text(const json& value);

/// tools/call-level error payload: `{error:{message, code}}`
json tool_error(const std::string& message, int code = -1);

/// Shape a ProcessResult into a tools/call result payload
///
/// ok:    `{content:[{type:"text", text:<ProcessResult as JSON text>}]}`
/// error: `{error:{message, code, reason?, timeout_s?}}`; code is the exit
///        code, or -1 when the process never produced one
json normalize_result(const ProcessResult& result);

/// Resolves tools/call requests against the table and runs them
class ToolInvoker
{
  public:
    /// Both references must outlive the invoker
    ToolInvoker(const ToolRegistry& registry, IScriptRunner& runner)
        : registry_(registry), runner_(runner)
    {
    }

    /// Run tool `name` with the given argument mapping (null = empty)
    ///
    /// Unknown tools and invalid arguments produce a tool_error payload
    /// without launching anything. Exceptions escaping the runner propagate.
    json call(const std::string& name, const json& arguments);

    /// Fill `out` with the positional script arguments for `spec`, defaults applied
    /// @return Error message when the arguments are unusable, nullopt otherwise
    std::optional<std::string> extract_arguments(
        const ToolSpec& spec, const json& arguments, std::vector<std::string>& out
    ) const;

    const ToolRegistry& registry() const
    {
        return registry_;
    }

  private:
    const ToolRegistry& registry_;
    IScriptRunner& runner_;
};

} // namespace dazmcp
