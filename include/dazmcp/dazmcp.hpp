// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file dazmcp.hpp
/// @brief Master include for the DAZ Studio MCP server library
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <dazmcp/config.hpp>
#include <dazmcp/jsonrpc.hpp>
#include <dazmcp/logging.hpp>
#include <dazmcp/process.hpp>
#include <dazmcp/process_runner.hpp>
#include <dazmcp/router.hpp>
#include <dazmcp/server.hpp>
#include <dazmcp/tools.hpp>
#include <dazmcp/transport.hpp>
#include <dazmcp/transport_stdio.hpp>
#include <dazmcp/transport_tcp.hpp>
#include <dazmcp/transport_websocket.hpp>
#include <dazmcp/types.hpp>
