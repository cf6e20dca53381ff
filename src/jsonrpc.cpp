// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/jsonrpc.hpp>

namespace dazmcp
{

ParseResult parse_message(const std::string& text)
{
    ParseResult result;

    json message = json::parse(text, nullptr, false);
    if (message.is_discarded())
    {
        result.error = JsonRpcErrorObject{
            static_cast<int>(JsonRpcErrorCode::ParseError), "Parse error"
        };
        return result;
    }

    if (!message.is_object())
    {
        result.error = JsonRpcErrorObject{
            static_cast<int>(JsonRpcErrorCode::InvalidRequest), "Invalid Request"
        };
        return result;
    }

    if (message.contains("id"))
        result.id = message.at("id");

    auto method = message.find("method");
    if (method == message.end() || !method->is_string())
    {
        result.error = JsonRpcErrorObject{
            static_cast<int>(JsonRpcErrorCode::InvalidRequest),
            "Invalid Request: missing method"
        };
        return result;
    }

    result.request = JsonRpcRequest::from_json(message);
    return result;
}

std::string encode_result(const json& id, const json& result)
{
    return dump_json(JsonRpcResponse::success(id, result).to_json());
}

std::string encode_error(const json& id, int code, const std::string& message)
{
    JsonRpcResponse response{id, std::nullopt, JsonRpcErrorObject{code, message}};
    return dump_json(response.to_json());
}

std::string encode_notification(const std::string& method, const json& params)
{
    JsonRpcRequest notification{method, params, std::nullopt};
    return dump_json(notification.to_json());
}

} // namespace dazmcp
