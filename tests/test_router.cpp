// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <dazmcp/router.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace dazmcp;

// =============================================================================
// Test fixtures
// =============================================================================

/// Answers every script with fixed stdout, or throws when asked to
class StubRunner : public IScriptRunner
{
  public:
    ProcessResult run(const std::string& script, const std::vector<std::string>& args) override
    {
        last_script = script;
        last_args = args;
        ++call_count;
        if (throw_on_run)
            throw std::runtime_error("runner exploded");

        ProcessResult r;
        r.status = ProcessStatus::Ok;
        r.returncode = 0;
        r.stdout_text = stdout_text;
        return r;
    }

    std::string stdout_text = "Scene loaded";
    bool throw_on_run = false;
    std::string last_script;
    std::vector<std::string> last_args;
    int call_count = 0;
};

class MethodRouterTest : public ::testing::Test
{
  protected:
    MethodRouterTest() : registry_(default_registry()), invoker_(registry_, runner_) {}

    /// Send one message through a router and decode the reply
    json round_trip(MethodRouter& router, const json& message)
    {
        auto reply = router.process(dump_json(message));
        EXPECT_TRUE(reply.has_value()) << "no response for " << message.dump();
        return reply ? json::parse(*reply) : json();
    }

    static json request(const json& id, const std::string& method, const json& params = nullptr)
    {
        json j = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        return j;
    }

    ToolRegistry registry_;
    StubRunner runner_;
    ToolInvoker invoker_;
};

// =============================================================================
// initialize
// =============================================================================

TEST_F(MethodRouterTest, InitializeEchoesProtocolVersion)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(
        router, request(1, "initialize", {{"protocolVersion", "2025-06-18"}, {"capabilities", {}}})
    );

    EXPECT_EQ(reply["jsonrpc"], "2.0");
    EXPECT_EQ(reply["id"], 1);
    EXPECT_EQ(reply["result"]["protocolVersion"], "2025-06-18");
    EXPECT_TRUE(reply["result"]["capabilities"]["tools"].is_object());
    EXPECT_TRUE(reply["result"]["capabilities"]["resources"].is_object());
    EXPECT_TRUE(reply["result"]["capabilities"]["prompts"].is_object());
    EXPECT_EQ(reply["result"]["serverInfo"]["name"], "daz-studio-mcp");
    EXPECT_EQ(reply["result"]["serverInfo"]["version"], "1.3.0");
}

TEST_F(MethodRouterTest, InitializeEchoesOlderVersion)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(1, "initialize", {{"protocolVersion", "2024-11-05"}}));

    EXPECT_EQ(reply["result"]["protocolVersion"], "2024-11-05");
}

TEST_F(MethodRouterTest, InitializeWithoutVersionUsesDefault)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request("init", "initialize"));

    EXPECT_EQ(reply["id"], "init");
    EXPECT_EQ(reply["result"]["protocolVersion"], kDefaultProtocolVersion);
}

// =============================================================================
// tools/list, resources/list, prompts/list
// =============================================================================

TEST_F(MethodRouterTest, ToolsListReturnsAllToolsInOrder)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(2, "tools/list"));

    const json& tools = reply["result"]["tools"];
    ASSERT_EQ(tools.size(), 5u);
    EXPECT_EQ(tools[0]["name"], "load_scene");
    EXPECT_EQ(tools[1]["name"], "set_pose");
    EXPECT_EQ(tools[2]["name"], "render_scene");
    EXPECT_EQ(tools[3]["name"], "read_scene");
    EXPECT_EQ(tools[4]["name"], "list_content");
    for (const auto& tool : tools)
    {
        EXPECT_TRUE(tool.contains("description"));
        EXPECT_EQ(tool["inputSchema"]["type"], "object");
    }
}

TEST_F(MethodRouterTest, ResourcesAndPromptsAreEmpty)
{
    MethodRouter router(invoker_);

    EXPECT_EQ(round_trip(router, request(3, "resources/list"))["result"]["resources"], json::array());
    EXPECT_EQ(round_trip(router, request(4, "prompts/list"))["result"]["prompts"], json::array());
}

// =============================================================================
// tools/call
// =============================================================================

TEST_F(MethodRouterTest, ToolsCallEmbedsProcessResult)
{
    runner_.stdout_text = "Scene loaded: /scenes/a.duf";
    MethodRouter router(invoker_);

    auto reply = round_trip(
        router,
        request(
            5, "tools/call", {{"name", "load_scene"}, {"arguments", {{"scene_path", "/scenes/a.duf"}}}}
        )
    );

    EXPECT_EQ(reply["id"], 5);
    EXPECT_EQ(runner_.last_script, "load_scene.dsa");
    EXPECT_EQ(runner_.last_args, (std::vector<std::string>{"/scenes/a.duf"}));

    const json& content = reply["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    auto embedded = json::parse(content[0]["text"].get<std::string>());
    EXPECT_EQ(embedded["status"], "ok");
    EXPECT_EQ(embedded["stdout"], "Scene loaded: /scenes/a.duf");
}

TEST_F(MethodRouterTest, ToolsCallWithoutArguments)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(6, "tools/call", {{"name", "read_scene"}}));

    EXPECT_TRUE(reply["result"].contains("content"));
    EXPECT_EQ(runner_.last_script, "read_scene.dsa");
    EXPECT_TRUE(runner_.last_args.empty());
}

TEST_F(MethodRouterTest, ToolsCallUnknownToolIsToolLevelError)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(7, "tools/call", {{"name", "nope"}, {"arguments", {}}}));

    EXPECT_FALSE(reply.contains("error"));
    EXPECT_EQ(reply["result"]["error"]["message"], "Unknown tool: nope");
    EXPECT_EQ(runner_.call_count, 0);
}

TEST_F(MethodRouterTest, ToolsCallWithoutNameIsToolLevelError)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(8, "tools/call", {{"arguments", {}}}));

    EXPECT_EQ(reply["id"], 8);
    EXPECT_FALSE(reply.contains("error"));
    EXPECT_EQ(reply["result"]["error"]["message"], "Unknown tool: null");
    EXPECT_EQ(reply["result"]["error"]["code"], -1);
    EXPECT_EQ(runner_.call_count, 0);
}

TEST_F(MethodRouterTest, ToolsCallWithNonStringNameIsToolLevelError)
{
    MethodRouter router(invoker_);

    auto numeric = round_trip(router, request(10, "tools/call", {{"name", 42}}));
    EXPECT_FALSE(numeric.contains("error"));
    EXPECT_EQ(numeric["result"]["error"]["message"], "Unknown tool: 42");

    auto no_params = round_trip(router, request(11, "tools/call"));
    EXPECT_FALSE(no_params.contains("error"));
    EXPECT_EQ(no_params["result"]["error"]["message"], "Unknown tool: null");

    EXPECT_EQ(runner_.call_count, 0);
}

TEST_F(MethodRouterTest, RunnerExceptionBecomesServerError)
{
    runner_.throw_on_run = true;
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(9, "tools/call", {{"name", "list_content"}}));

    EXPECT_EQ(reply["id"], 9);
    EXPECT_FALSE(reply.contains("result"));
    EXPECT_EQ(reply["error"]["code"], -32000);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("runner exploded"), std::string::npos);
}

// =============================================================================
// Protocol errors
// =============================================================================

TEST_F(MethodRouterTest, UnknownMethodNamesTheMethod)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(10, "bogus/method"));

    EXPECT_EQ(reply["id"], 10);
    EXPECT_EQ(reply["error"]["code"], -32601);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("bogus/method"), std::string::npos);
}

TEST_F(MethodRouterTest, MalformedJsonGetsParseErrorWithNullId)
{
    MethodRouter router(invoker_);

    auto reply = router.process(R"({"jsonrpc":"2.0","id":1,"method":"tools/li)");

    ASSERT_TRUE(reply.has_value());
    auto j = json::parse(*reply);
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], -32700);
}

TEST_F(MethodRouterTest, MissingMethodIsInvalidRequest)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, json{{"jsonrpc", "2.0"}, {"id", 11}});

    EXPECT_EQ(reply["id"], 11);
    EXPECT_EQ(reply["error"]["code"], -32600);
}

TEST_F(MethodRouterTest, NullIdIsAnswered)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(nullptr, "tools/list"));

    EXPECT_TRUE(reply["id"].is_null());
    EXPECT_TRUE(reply.contains("result"));
}

// =============================================================================
// Notifications
// =============================================================================

TEST_F(MethodRouterTest, InitializedNotificationGetsNoResponse)
{
    MethodRouter router(invoker_);

    auto reply = router.process(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    EXPECT_FALSE(reply.has_value());
}

TEST_F(MethodRouterTest, UnknownNotificationIgnored)
{
    MethodRouter router(invoker_);

    EXPECT_FALSE(router.process(R"({"jsonrpc":"2.0","method":"notifications/cancelled"})"));
    EXPECT_FALSE(router.process(R"({"jsonrpc":"2.0","method":"bogus/method"})"));
}

TEST_F(MethodRouterTest, NotificationForRequestMethodIsNotAnswered)
{
    MethodRouter router(invoker_);

    auto reply = router.process(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"read_scene"}})"
    );

    EXPECT_FALSE(reply.has_value());
    EXPECT_EQ(runner_.call_count, 0);
}

// =============================================================================
// Method table
// =============================================================================

TEST_F(MethodRouterTest, RegisteredMethods)
{
    MethodRouter router(invoker_);

    EXPECT_EQ(
        router.methods(),
        (std::vector<std::string>{
            "initialize", "prompts/list", "resources/list", "tools/call", "tools/list"
        })
    );
    EXPECT_FALSE(router.has_method("notifications/initialized"));
    EXPECT_FALSE(router.has_method("loadScene"));
}

TEST_F(MethodRouterTest, LegacyMethodsWhenEnabled)
{
    RouterOptions options;
    options.legacy_methods = true;
    MethodRouter router(invoker_, options);

    EXPECT_TRUE(router.has_method("loadScene"));
    EXPECT_TRUE(router.has_method("setPose"));
    EXPECT_TRUE(router.has_method("render"));

    auto reply = round_trip(router, request(12, "render", {{"output_path", "/tmp/r.png"}}));

    EXPECT_EQ(reply["id"], 12);
    EXPECT_TRUE(reply["result"].contains("content"));
    EXPECT_EQ(runner_.last_script, "render_scene.dsa");
    EXPECT_EQ(runner_.last_args, (std::vector<std::string>{"/tmp/r.png", "800", "600"}));
}

TEST_F(MethodRouterTest, LegacyMethodsRejectedByDefault)
{
    MethodRouter router(invoker_);

    auto reply = round_trip(router, request(13, "loadScene", {{"scene_path", "a.duf"}}));

    EXPECT_EQ(reply["error"]["code"], -32601);
    EXPECT_EQ(runner_.call_count, 0);
}

TEST_F(MethodRouterTest, DispatchDecodedRequest)
{
    MethodRouter router(invoker_);

    auto response = router.dispatch(JsonRpcRequest{"tools/list", nullptr, json(14)});

    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->is_error());
    EXPECT_EQ(response->id, 14);
    EXPECT_EQ((*response->result)["tools"].size(), 5u);
}
