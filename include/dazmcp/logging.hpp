// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace dazmcp
{

/// Shared server logger ("dazmcp"), writing to stderr only
///
/// stdout carries protocol traffic in stdio mode, so nothing else may log there.
spdlog::logger& logger();

/// Map DEBUG/INFO/WARNING/WARN/ERROR/CRITICAL/OFF (any case) to a level
/// @return info for unrecognised names
spdlog::level::level_enum parse_log_level(const std::string& name);

/// Apply the configured level and output pattern
void init_logging(const std::string& level);

} // namespace dazmcp
