// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <dazmcp/types.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace dazmcp
{

// =============================================================================
// JSON-RPC 2.0 Exceptions
// =============================================================================

/// JSON-RPC error codes (standard and server-defined)
enum class JsonRpcErrorCode : int
{
    // Standard JSON-RPC 2.0 errors
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    // Server errors (-32000 to -32099)
    ServerError = -32000,
};

/// Exception for JSON-RPC errors raised by method handlers
class JsonRpcError : public std::runtime_error
{
  public:
    JsonRpcError(JsonRpcErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code)
    {
    }

    JsonRpcErrorCode code() const
    {
        return code_;
    }

  private:
    JsonRpcErrorCode code_;
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// JSON-RPC 2.0 Request or Notification
///
/// The id is kept as the raw JSON value the client sent so it can be echoed
/// back unchanged, whatever its type.
struct JsonRpcRequest
{
    std::string method;
    json params;
    std::optional<json> id; // nullopt for notifications

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        if (id)
            j["id"] = *id;
        return j;
    }

    /// @throws json::exception if `method` is missing or not a string
    static JsonRpcRequest from_json(const json& j)
    {
        JsonRpcRequest req;
        req.method = j.at("method").get<std::string>();
        if (j.contains("params"))
            req.params = j.at("params");
        if (j.contains("id"))
            req.id = j.at("id");
        return req;
    }

    /// A message without an `id` key never receives a response
    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int code;
    std::string message;

    json to_json() const
    {
        return json{{"code", code}, {"message", message}};
    }

    static JsonRpcErrorObject from_json(const json& j)
    {
        JsonRpcErrorObject err;
        err.code = j.at("code").get<int>();
        err.message = j.at("message").get<std::string>();
        return err;
    }
};

/// JSON-RPC 2.0 Response (exactly one of result / error is set)
struct JsonRpcResponse
{
    json id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"id", id}};
        if (error)
            j["error"] = error->to_json();
        else
            j["result"] = result.value_or(json::object());
        return j;
    }

    static JsonRpcResponse from_json(const json& j)
    {
        JsonRpcResponse resp;
        if (j.contains("id"))
            resp.id = j.at("id");
        if (j.contains("result"))
            resp.result = j.at("result");
        if (j.contains("error"))
            resp.error = JsonRpcErrorObject::from_json(j.at("error"));
        return resp;
    }

    bool is_error() const
    {
        return error.has_value();
    }

    static JsonRpcResponse success(json id, json result)
    {
        return JsonRpcResponse{std::move(id), std::move(result), std::nullopt};
    }

    static JsonRpcResponse failure(json id, JsonRpcErrorCode code, const std::string& message)
    {
        return JsonRpcResponse{
            std::move(id), std::nullopt, JsonRpcErrorObject{static_cast<int>(code), message}
        };
    }
};

// =============================================================================
// Envelope Codec
// =============================================================================

/// Outcome of decoding one raw inbound message
///
/// Either `request` is set, or `error` is set together with whatever id could
/// be recovered before decoding failed (null when none).
struct ParseResult
{
    std::optional<JsonRpcRequest> request;
    std::optional<JsonRpcErrorObject> error;
    json id;

    bool ok() const
    {
        return request.has_value();
    }
};

/// Decode raw text into a Request or Notification
///
/// Never throws. Undecodable text yields a ParseError with a null id; a
/// decodable value that is not a request object yields InvalidRequest.
ParseResult parse_message(const std::string& text);

/// Serialize `{jsonrpc, id, result}`
std::string encode_result(const json& id, const json& result);

/// Serialize `{jsonrpc, id, error:{code, message}}`
std::string encode_error(const json& id, int code, const std::string& message);

/// Serialize an outbound notification `{jsonrpc, method, params?}`
std::string encode_notification(const std::string& method, const json& params = nullptr);

} // namespace dazmcp
