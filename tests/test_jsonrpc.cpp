// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/jsonrpc.hpp>
#include <gtest/gtest.h>

using namespace dazmcp;

// =============================================================================
// JSON-RPC Message Type Tests
// =============================================================================

TEST(JsonRpcMessageTest, RequestSerialization)
{
    JsonRpcRequest req{"tools/call", json{{"name", "read_scene"}}, json(1)};

    auto j = req.to_json();
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "tools/call");
    EXPECT_EQ(j["params"]["name"], "read_scene");
    EXPECT_EQ(j["id"], 1);
}

TEST(JsonRpcMessageTest, RequestWithoutParams)
{
    JsonRpcRequest req{"tools/list", nullptr, json(2)};

    auto j = req.to_json();
    EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpcMessageTest, NotificationSerialization)
{
    JsonRpcRequest notif{"notifications/initialized", json::object(), std::nullopt};

    auto j = notif.to_json();
    EXPECT_EQ(j["method"], "notifications/initialized");
    EXPECT_FALSE(j.contains("id"));
    EXPECT_TRUE(notif.is_notification());
}

TEST(JsonRpcMessageTest, ResponseSerialization)
{
    auto resp = JsonRpcResponse::success(1, json{{"tools", json::array()}});

    auto j = resp.to_json();
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_TRUE(j["result"]["tools"].is_array());
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcMessageTest, ErrorResponseSerialization)
{
    auto resp = JsonRpcResponse::failure(1, JsonRpcErrorCode::MethodNotFound, "Method not found: x");

    auto j = resp.to_json();
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found: x");
}

TEST(JsonRpcMessageTest, ResponseDeserialization)
{
    json j = {{"jsonrpc", "2.0"}, {"result", {{"message", "pong"}}}, {"id", 1}};

    auto resp = JsonRpcResponse::from_json(j);
    EXPECT_EQ(resp.id, 1);
    EXPECT_TRUE(resp.result.has_value());
    EXPECT_EQ((*resp.result)["message"], "pong");
    EXPECT_FALSE(resp.is_error());
}

TEST(JsonRpcMessageTest, ErrorResponseDeserialization)
{
    json j = {
        {"jsonrpc", "2.0"}, {"error", {{"code", -32600}, {"message", "Invalid Request"}}}, {"id", 1}
    };

    auto resp = JsonRpcResponse::from_json(j);
    EXPECT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, -32600);
    EXPECT_EQ(resp.error->message, "Invalid Request");
}

TEST(JsonRpcMessageTest, StringIdSupport)
{
    JsonRpcRequest req{"tools/list", nullptr, json("req-abc-123")};

    auto j = req.to_json();
    EXPECT_EQ(j["id"], "req-abc-123");

    auto parsed = JsonRpcRequest::from_json(j);
    ASSERT_TRUE(parsed.id.has_value());
    EXPECT_EQ(*parsed.id, "req-abc-123");
}

TEST(JsonRpcMessageTest, NullIdIsStillARequest)
{
    auto parsed = JsonRpcRequest::from_json(json{{"jsonrpc", "2.0"}, {"method", "x"}, {"id", nullptr}});

    ASSERT_TRUE(parsed.id.has_value());
    EXPECT_TRUE(parsed.id->is_null());
    EXPECT_FALSE(parsed.is_notification());
}

// =============================================================================
// parse_message Tests
// =============================================================================

TEST(ParseMessageTest, Request)
{
    auto result = parse_message(R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{}})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.request->method, "tools/list");
    EXPECT_EQ(*result.request->id, 7);
    EXPECT_TRUE(result.request->params.is_object());
    EXPECT_FALSE(result.error.has_value());
}

TEST(ParseMessageTest, Notification)
{
    auto result = parse_message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.request->is_notification());
    EXPECT_TRUE(result.request->params.is_null());
}

TEST(ParseMessageTest, IdOfAnyJsonTypeIsKept)
{
    auto result = parse_message(R"({"jsonrpc":"2.0","id":{"n":[1,2]},"method":"m"})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.request->id, (json{{"n", {1, 2}}}));
}

TEST(ParseMessageTest, MalformedJson)
{
    auto result = parse_message(R"({"jsonrpc":"2.0","id":1,"method":)");

    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, -32700);
    EXPECT_EQ(result.error->message, "Parse error");
    EXPECT_TRUE(result.id.is_null());
}

TEST(ParseMessageTest, EmptyText)
{
    auto result = parse_message("");

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, -32700);
}

TEST(ParseMessageTest, NonObjectValue)
{
    for (const char* text : {"[1,2,3]", "42", "\"tools/list\"", "null"})
    {
        auto result = parse_message(text);
        ASSERT_TRUE(result.error.has_value()) << text;
        EXPECT_EQ(result.error->code, -32600) << text;
        EXPECT_TRUE(result.id.is_null()) << text;
    }
}

TEST(ParseMessageTest, MissingMethodKeepsId)
{
    auto result = parse_message(R"({"jsonrpc":"2.0","id":"abc"})");

    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, -32600);
    EXPECT_EQ(result.id, "abc");
}

TEST(ParseMessageTest, NonStringMethod)
{
    auto result = parse_message(R"({"jsonrpc":"2.0","id":3,"method":5})");

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, -32600);
    EXPECT_EQ(result.id, 3);
}

// =============================================================================
// Encoder Tests
// =============================================================================

TEST(EncodeTest, Result)
{
    auto text = encode_result(5, json{{"ok", true}});

    auto j = json::parse(text);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 5);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(text.find('\n'), std::string::npos);
}

TEST(EncodeTest, ErrorWithNullId)
{
    auto j = json::parse(encode_error(nullptr, -32700, "Parse error"));

    EXPECT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], -32700);
    EXPECT_EQ(j["error"]["message"], "Parse error");
    EXPECT_FALSE(j.contains("result"));
}

TEST(EncodeTest, Notification)
{
    auto j = json::parse(encode_notification("notifications/tools/list_changed"));

    EXPECT_EQ(j["method"], "notifications/tools/list_changed");
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("params"));
}

TEST(EncodeTest, InvalidUtf8IsReplaced)
{
    std::string raw = "render \xff\xfe done";

    std::string text;
    EXPECT_NO_THROW(text = encode_result(1, json{{"stdout", raw}}));

    auto j = json::parse(text);
    EXPECT_NE(j["result"]["stdout"].get<std::string>().find("done"), std::string::npos);
}

// =============================================================================
// Error Type Tests
// =============================================================================

TEST(JsonRpcErrorTest, ErrorCodeValues)
{
    EXPECT_EQ(static_cast<int>(JsonRpcErrorCode::ParseError), -32700);
    EXPECT_EQ(static_cast<int>(JsonRpcErrorCode::InvalidRequest), -32600);
    EXPECT_EQ(static_cast<int>(JsonRpcErrorCode::MethodNotFound), -32601);
    EXPECT_EQ(static_cast<int>(JsonRpcErrorCode::InvalidParams), -32602);
    EXPECT_EQ(static_cast<int>(JsonRpcErrorCode::ServerError), -32000);
}

TEST(JsonRpcErrorTest, CarriesCodeAndMessage)
{
    JsonRpcError error(JsonRpcErrorCode::InvalidParams, "bad params");
    EXPECT_EQ(error.code(), JsonRpcErrorCode::InvalidParams);
    EXPECT_STREQ(error.what(), "bad params");
}
