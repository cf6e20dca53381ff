// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file process_runner.hpp
/// @brief Runs renderer scripts under a hard wall-clock timeout

#include <chrono>
#include <dazmcp/types.hpp>
#include <string>
#include <vector>

namespace dazmcp
{

/// Executes one named script with positional arguments
///
/// Implementations must never throw for outcomes of the script itself:
/// nonzero exit, timeout and launch failure are all reported in the result.
class IScriptRunner
{
  public:
    virtual ~IScriptRunner() = default;

    virtual ProcessResult run(const std::string& script, const std::vector<std::string>& args) = 0;
};

/// Settings for ProcessRunner
struct ProcessRunnerOptions
{
    /// Renderer executable (looked up in PATH when not a path)
    std::string executable = "dazstudio";

    /// Directory the script identifiers are resolved against
    std::string script_root = "scripts";

    /// Upper bound on a single invocation, output draining included
    std::chrono::seconds timeout{60};
};

/// Launches the renderer as
/// `<executable> -noPrompt -script <script_root>/<script> [-scriptArg <arg>]*`
///
/// The script path is not checked for existence; a missing script surfaces
/// through the renderer's own exit status. The child gets an already closed
/// stdin and runs in its own process group, which is killed as a whole when
/// the timeout expires.
class ProcessRunner : public IScriptRunner
{
  public:
    explicit ProcessRunner(ProcessRunnerOptions options);

    ProcessResult run(const std::string& script, const std::vector<std::string>& args) override;

    /// Full path a script identifier resolves to
    std::string script_path(const std::string& script) const;

    /// Complete argument vector passed after the executable
    std::vector<std::string> build_arguments(
        const std::string& script, const std::vector<std::string>& args
    ) const;

    const ProcessRunnerOptions& options() const
    {
        return options_;
    }

  private:
    ProcessRunnerOptions options_;
};

/// Trim surrounding whitespace from captured process output
std::string trim_output(const std::string& text);

} // namespace dazmcp
