// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/logging.hpp>
#include <dazmcp/process.hpp>
#include <dazmcp/process_runner.hpp>

#include <filesystem>

namespace dazmcp
{

namespace
{

int64_t elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start
    )
        .count();
}

} // namespace

std::string trim_output(const std::string& text)
{
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

ProcessRunner::ProcessRunner(ProcessRunnerOptions options) : options_(std::move(options)) {}

std::string ProcessRunner::script_path(const std::string& script) const
{
    return (std::filesystem::path(options_.script_root) / script).string();
}

std::vector<std::string> ProcessRunner::build_arguments(
    const std::string& script, const std::vector<std::string>& args
) const
{
    std::vector<std::string> argv = {"-noPrompt", "-script", script_path(script)};
    argv.reserve(argv.size() + args.size() * 2);
    for (const auto& arg : args)
    {
        argv.push_back("-scriptArg");
        argv.push_back(arg);
    }
    return argv;
}

ProcessResult ProcessRunner::run(const std::string& script, const std::vector<std::string>& args)
{
    const auto start = std::chrono::steady_clock::now();
    const auto argv = build_arguments(script, args);

    if (logger().should_log(spdlog::level::debug))
    {
        std::string command = options_.executable;
        for (const auto& arg : argv)
            command += " " + arg;
        logger().debug("Launching script {} with {} argument(s): {}", script, args.size(), command);
    }

    ProcessResult result;

    try
    {
        ProcessOptions opts;
        opts.redirect_stdin = true;
        opts.redirect_stdout = true;
        opts.redirect_stderr = true;
        opts.new_process_group = true;

        Process proc;
        proc.spawn(options_.executable, argv, opts);
        // The renderer must not read the server's own stdin (the protocol channel in stdio mode)
        proc.stdin_pipe().close();

        auto output = proc.communicate(options_.timeout);

        if (output.timed_out)
        {
            proc.kill();
            proc.wait();

            result.status = ProcessStatus::Error;
            result.reason = kTimeoutReason;
            result.timeout_s = static_cast<int>(options_.timeout.count());
        }
        else
        {
            result.returncode = output.exit_code.value_or(-1);
            result.status = (*result.returncode == 0) ? ProcessStatus::Ok : ProcessStatus::Error;
        }

        result.stdout_text = trim_output(output.stdout_data);
        result.stderr_text = trim_output(output.stderr_data);
    }
    catch (const ProcessError& e)
    {
        result = ProcessResult{};
        result.status = ProcessStatus::Error;
        result.reason = kLaunchFailedReason;
        result.stderr_text = e.what();
    }

    result.duration_ms = elapsed_ms(start);

    if (result.ok())
    {
        logger().info("Script {} finished: rc=0 duration_ms={}", script, result.duration_ms);
    }
    else if (result.timed_out())
    {
        logger().error(
            "Script {} timed out after {}s (duration_ms={})",
            script,
            options_.timeout.count(),
            result.duration_ms
        );
    }
    else if (result.returncode)
    {
        logger().error(
            "Script {} finished: rc={} duration_ms={}",
            script,
            *result.returncode,
            result.duration_ms
        );
    }
    else
    {
        logger().error("Script {} failed to launch: {}", script, result.stderr_text);
    }

    return result;
}

} // namespace dazmcp
