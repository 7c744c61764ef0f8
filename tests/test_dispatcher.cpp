//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_dispatcher.cpp
// Purpose: GoogleTests for JSON-RPC dispatch (initialize, tools/list, tools/call, notifications)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "adomcp/Dispatcher.h"

using namespace adomcp;

namespace {

JSONRPCRequest makeRequest(const std::string& json) {
    JSONRPCRequest req;
    if (!req.Deserialize(json)) {
        throw std::runtime_error("test request did not parse: " + json);
    }
    return req;
}

int errorCode(const JSONRPCResponse& resp) {
    const JSONValue* code = resp.error->Find("code");
    return code ? static_cast<int>(std::get<int64_t>(code->value)) : 0;
}

std::string errorMessage(const JSONRPCResponse& resp) {
    const JSONValue* msg = resp.error->Find("message");
    return msg ? std::get<std::string>(msg->value) : std::string();
}

//==========================================================================================================
// DispatcherFixture
// Purpose: Registry with an echo tool, a failing tool and a gated tool used for ordering tests.
//==========================================================================================================
class DispatcherFixture : public ::testing::Test {
public:
    void openGate() {
        {
            std::lock_guard<std::mutex> lock(gateMutex);
            gateOpen = true;
        }
        gateCv.notify_all();
    }

protected:
    void SetUp() override {
        JSONValue::Object props;
        JSONValue::Object textProp;
        textProp["type"] = std::make_shared<JSONValue>("string");
        props["text"] = std::make_shared<JSONValue>(std::move(textProp));
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>("object");
        schema["properties"] = std::make_shared<JSONValue>(std::move(props));

        tools.Register(Tool{"echo", "Echo text", JSONValue{std::move(schema)}}, [](const JSONValue& args) {
            const JSONValue* t = args.Find("text");
            return CallToolResult::Text(t && t->IsString() ? std::get<std::string>(t->value) : std::string("(none)"));
        });
        tools.Register(Tool{"fail", "Always fails"}, [](const JSONValue&) -> CallToolResult {
            throw std::runtime_error("API request failed with status 401: unauthorized");
        });
        tools.Register(Tool{"slow", "Waits for the gate"}, [this](const JSONValue&) {
            std::unique_lock<std::mutex> lock(gateMutex);
            gateCv.wait(lock, [this] { return gateOpen; });
            return CallToolResult::Text("slow done");
        });
    }

    ToolRegistry tools;
    SessionDirectory sessions;
    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool gateOpen = false;
};

} // namespace

//==========================================================================================================
// initialize returns the protocol version, tools capability and server info.
//==========================================================================================================
TEST_F(DispatcherFixture, InitializeReturnsServerInfo) {
    Dispatcher d(tools, sessions);
    auto resp = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})"));
    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->Serialize(),
              "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"capabilities\":{\"tools\":{}},"
              "\"protocolVersion\":\"2024-11-05\",\"serverInfo\":{\"name\":\"adomcp\",\"version\":\"1.0.0\"}}}");
}

TEST_F(DispatcherFixture, ToolsListReturnsRegisteredTools) {
    Dispatcher d(tools, sessions);
    auto resp = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":"l","method":"tools/list"})"));
    ASSERT_TRUE(resp);
    ASSERT_TRUE(resp->result.has_value());
    const JSONValue* list = resp->result->Find("tools");
    ASSERT_NE(list, nullptr);
    const auto& arr = std::get<JSONValue::Array>(list->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(std::get<std::string>(arr[0]->Find("name")->value), "echo");
    EXPECT_NE(arr[0]->Find("inputSchema"), nullptr);
    EXPECT_EQ(std::get<std::string>(arr[1]->Find("name")->value), "fail");
}

TEST_F(DispatcherFixture, ToolsCallInvokesHandler) {
    Dispatcher d(tools, sessions);
    auto resp = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})"));
    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->Serialize(),
              "{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"content\":[{\"text\":\"hi\",\"type\":\"text\"}],\"isError\":false}}");

    auto noArgs = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo"}})"));
    ASSERT_TRUE(noArgs);
    EXPECT_FALSE(noArgs->IsError());
}

//==========================================================================================================
// A failing handler produces a successful response whose result is flagged isError.
//==========================================================================================================
TEST_F(DispatcherFixture, HandlerFailureBecomesErrorResult) {
    Dispatcher d(tools, sessions);
    auto resp = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"fail","arguments":{}}})"));
    ASSERT_TRUE(resp);
    EXPECT_FALSE(resp->IsError());
    EXPECT_EQ(resp->Serialize(),
              "{\"jsonrpc\":\"2.0\",\"id\":4,\"result\":{\"content\":[{\"text\":\"API request failed with status 401: unauthorized\","
              "\"type\":\"text\"}],\"isError\":true}}");
}

//==========================================================================================================
// Malformed tools/call params are InvalidParams and never reach the named tool's handler.
//==========================================================================================================
TEST_F(DispatcherFixture, InvalidCallParamsAreRejected) {
    std::atomic<int> counted{0};
    tools.Register(Tool{"counted", "Counts invocations"}, [&counted](const JSONValue&) {
        ++counted;
        return CallToolResult::Text("counted");
    });

    Dispatcher d(tools, sessions);
    const char* bad[] = {
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call"})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":null})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":["counted"]})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":"counted"})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"arguments":{"name":"counted"}}})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":""}})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":["counted"]}})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"counted","arguments":"text"}})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"counted","arguments":5}})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"counted","arguments":["x"]}})",
    };
    for (const char* json : bad) {
        auto resp = d.Handle(makeRequest(json));
        ASSERT_TRUE(resp) << json;
        ASSERT_TRUE(resp->IsError()) << json;
        EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams) << json;
        EXPECT_EQ(std::get<int64_t>(resp->id), 5);
    }
    EXPECT_EQ(counted.load(), 0);

    auto good = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":1.5,"method":"tools/call","params":{"name":"counted","arguments":{}}})"));
    ASSERT_TRUE(good);
    EXPECT_FALSE(good->IsError());
    EXPECT_EQ(counted.load(), 1);
    EXPECT_EQ(good->Serialize().rfind("{\"jsonrpc\":\"2.0\",\"id\":1.5,", 0), 0u);
}

TEST_F(DispatcherFixture, UnknownToolAndMethodAreMethodNotFound) {
    Dispatcher d(tools, sessions);
    auto tool = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"nope"}})"));
    ASSERT_TRUE(tool && tool->IsError());
    EXPECT_EQ(errorCode(*tool), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*tool), "Tool not found: nope");

    auto method = d.Handle(makeRequest(R"({"jsonrpc":"2.0","id":7,"method":"resources/list"})"));
    ASSERT_TRUE(method && method->IsError());
    EXPECT_EQ(errorCode(*method), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*method), "Method not found: resources/list");
}

TEST_F(DispatcherFixture, WrongProtocolVersionIsInvalidRequest) {
    Dispatcher d(tools, sessions);
    auto resp = d.Handle(makeRequest(R"({"jsonrpc":"1.0","id":8,"method":"initialize"})"));
    ASSERT_TRUE(resp && resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(DispatcherFixture, NotificationsProduceNoResponse) {
    Dispatcher d(tools, sessions);
    EXPECT_EQ(d.Handle(makeRequest(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")), nullptr);
    EXPECT_EQ(d.Handle(makeRequest(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{}})")), nullptr);
}

//==========================================================================================================
// Dispatch delivers serialized responses to the session queue; notifications deliver nothing.
//==========================================================================================================
TEST_F(DispatcherFixture, DispatchDeliversToSessionQueue) {
    Dispatcher d(tools, sessions);
    auto s = sessions.Create();
    d.Dispatch(s->Id(), makeRequest(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"));
    d.Dispatch(s->Id(), makeRequest(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    d.WaitForIdle();
    auto out = s->Drain();
    ASSERT_EQ(out.size(), 1u);
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(out[0]));
    EXPECT_EQ(std::get<int64_t>(resp.id), 1);
}

TEST_F(DispatcherFixture, DispatchToVanishedSessionIsDropped) {
    Dispatcher d(tools, sessions);
    auto s = sessions.Create();
    const std::string id = s->Id();
    sessions.Remove(id);
    d.Dispatch(id, makeRequest(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
    d.WaitForIdle();
    EXPECT_EQ(s->Pending(), 0u);
}

//==========================================================================================================
// A slow tool call does not hold back a later fast request on the same session.
//==========================================================================================================
TEST_F(DispatcherFixture, SlowRequestDoesNotBlockLaterRequests) {
    Dispatcher d(tools, sessions);
    // Releases the slow handler before ~Dispatcher waits on it, even when an assertion bails out early
    struct GateOpener {
        DispatcherFixture* f;
        ~GateOpener() { f->openGate(); }
    } opener{this};
    auto s = sessions.Create();

    std::mutex m;
    std::condition_variable cv;
    std::size_t queued = 0;
    s->SetWakeup([&] {
        {
            std::lock_guard<std::mutex> lock(m);
            ++queued;
        }
        cv.notify_all();
    });

    d.Dispatch(s->Id(), makeRequest(R"({"jsonrpc":"2.0","id":"slow","method":"tools/call","params":{"name":"slow"}})"));
    d.Dispatch(s->Id(), makeRequest(R"({"jsonrpc":"2.0","id":"fast","method":"tools/list"})"));

    {
        std::unique_lock<std::mutex> lock(m);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(10), [&] { return queued >= 1; }));
    }
    auto first = s->Drain();
    ASSERT_EQ(first.size(), 1u);
    JSONRPCResponse fast;
    ASSERT_TRUE(fast.Deserialize(first[0]));
    EXPECT_EQ(std::get<std::string>(fast.id), "fast");

    openGate();
    d.WaitForIdle();
    auto second = s->Drain();
    ASSERT_EQ(second.size(), 1u);
    JSONRPCResponse slow;
    ASSERT_TRUE(slow.Deserialize(second[0]));
    EXPECT_EQ(std::get<std::string>(slow.id), "slow");
    EXPECT_EQ(d.InFlight(), 0u);
}
