//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json_parser.cpp
// Purpose: GoogleTests for the JSON parser/serializer and JSON-RPC envelopes
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "adomcp/JSONRPCTypes.h"

using namespace adomcp;

//==========================================================================================================
// Nested documents parse into the expected variant alternatives.
//==========================================================================================================
TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v = ParseJSONValue(R"({"a":[1,2.5,"x",true,null],"b":{"c":-7}})");
    ASSERT_TRUE(v.IsObject());
    const JSONValue* a = v.Find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->IsArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(arr[3]->value));
    EXPECT_TRUE(arr[4]->IsNull());

    const JSONValue* b = v.Find("b");
    ASSERT_NE(b, nullptr);
    const JSONValue* c = b->Find("c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(std::get<int64_t>(c->value), -7);
}

//==========================================================================================================
// \u escapes including surrogate pairs decode to UTF-8.
//==========================================================================================================
TEST(JSONParser, DecodesUnicodeEscapes) {
    JSONValue v = ParseJSONValue(R"("caf\u00e9 \ud83d\ude80")");
    EXPECT_EQ(std::get<std::string>(v.value), "caf\xC3\xA9 \xF0\x9F\x9A\x80");
}

//==========================================================================================================
// Malformed input is rejected with JSONParseError.
//==========================================================================================================
TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSONValue("{"), JSONParseError);
    EXPECT_THROW(ParseJSONValue("{\"a\":1,}"), JSONParseError);
    EXPECT_THROW(ParseJSONValue("[1 2]"), JSONParseError);
    EXPECT_THROW(ParseJSONValue("01"), JSONParseError);
    EXPECT_THROW(ParseJSONValue("{} extra"), JSONParseError);
    EXPECT_THROW(ParseJSONValue("\"\\ud800\""), JSONParseError);
    EXPECT_THROW(ParseJSONValue(""), JSONParseError);
    EXPECT_THROW(ParseJSONValue(std::string(300, '[') + std::string(300, ']')), JSONParseError);
}

//==========================================================================================================
// Serialization escapes control characters and sorts object keys.
//==========================================================================================================
TEST(JSONSerializer, EscapesAndSortsKeys) {
    JSONValue::Object o;
    o["z"] = std::make_shared<JSONValue>(std::string("line\nbreak \"q\""));
    o["a"] = std::make_shared<JSONValue>(static_cast<int64_t>(3));
    o["m"] = std::make_shared<JSONValue>(std::string(1, '\x01'));
    EXPECT_EQ(SerializeJSONValue(JSONValue{o}),
              "{\"a\":3,\"m\":\"\\u0001\",\"z\":\"line\\nbreak \\\"q\\\"\"}");
}

//==========================================================================================================
// Pretty printing uses the requested indent.
//==========================================================================================================
TEST(JSONSerializer, PrettyPrintsWithIndent) {
    JSONValue::Object inner;
    inner["name"] = std::make_shared<JSONValue>("CI");
    JSONValue::Object o;
    o["id"] = std::make_shared<JSONValue>(static_cast<int64_t>(1));
    o["definition"] = std::make_shared<JSONValue>(std::move(inner));
    EXPECT_EQ(SerializeJSONValue(JSONValue{o}, 2),
              "{\n  \"definition\": {\n    \"name\": \"CI\"\n  },\n  \"id\": 1\n}");
    EXPECT_EQ(SerializeJSONValue(JSONValue{JSONValue::Array{}}, 2), "[]");
}

//==========================================================================================================
// A request keeps string/integer/null ids and tells an absent id apart from null.
//==========================================================================================================
TEST(JSONRPCRequest, DeserializesIdsAndParams) {
    JSONRPCRequest withString;
    ASSERT_TRUE(withString.Deserialize(R"({"jsonrpc":"2.0","id":"abc","method":"tools/list","params":{}})"));
    EXPECT_TRUE(withString.hasId);
    EXPECT_EQ(std::get<std::string>(withString.id), "abc");
    ASSERT_TRUE(withString.params.has_value());
    EXPECT_TRUE(withString.params->IsObject());

    JSONRPCRequest withInt;
    ASSERT_TRUE(withInt.Deserialize(R"({"jsonrpc":"2.0","id":42,"method":"initialize"})"));
    EXPECT_EQ(std::get<int64_t>(withInt.id), 42);
    EXPECT_FALSE(withInt.params.has_value());

    JSONRPCRequest withNull;
    ASSERT_TRUE(withNull.Deserialize(R"({"jsonrpc":"2.0","id":null,"method":"initialize"})"));
    EXPECT_TRUE(withNull.hasId);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(withNull.id));

    JSONRPCRequest notification;
    ASSERT_TRUE(notification.Deserialize(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    EXPECT_FALSE(notification.hasId);
}

//==========================================================================================================
// Numeric ids that are not plain int64 values are echoed back exactly as written.
//==========================================================================================================
TEST(JSONRPCRequest, EchoesNonIntegerNumericIdsVerbatim) {
    const char* ids[] = {"1.0", "1.5", "18446744073709551615", "-2.5e3", "-0"};
    for (const char* text : ids) {
        JSONRPCRequest req;
        ASSERT_TRUE(req.Deserialize(std::string(R"({"jsonrpc":"2.0","id":)") + text + R"(,"method":"tools/list"})"))
            << text;
        EXPECT_TRUE(req.hasId);
        ASSERT_TRUE(std::holds_alternative<JSONRPCNumberId>(req.id)) << text;
        EXPECT_EQ(std::get<JSONRPCNumberId>(req.id).text, text);
        EXPECT_EQ(IdToString(req.id), text);

        JSONRPCResponse resp(req.id, JSONValue{JSONValue::Object{}});
        EXPECT_EQ(resp.Serialize(), std::string("{\"jsonrpc\":\"2.0\",\"id\":") + text + ",\"result\":{}}");

        auto err = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "nope");
        JSONRPCResponse back;
        ASSERT_TRUE(back.Deserialize(err->Serialize()));
        ASSERT_TRUE(std::holds_alternative<JSONRPCNumberId>(back.id));
        EXPECT_EQ(std::get<JSONRPCNumberId>(back.id).text, text);
    }

    // Plain integers keep their integer form; nested "id" members do not leak into the envelope id.
    JSONRPCRequest nested;
    ASSERT_TRUE(nested.Deserialize(R"({"id":7,"method":"tools/call","params":{"id":2.5}})"));
    EXPECT_EQ(std::get<int64_t>(nested.id), 7);
}

//==========================================================================================================
// Requests without a usable method or with a non-scalar id are rejected.
//==========================================================================================================
TEST(JSONRPCRequest, RejectsInvalidEnvelopes) {
    JSONRPCRequest req;
    EXPECT_FALSE(req.Deserialize("not json"));
    EXPECT_FALSE(req.Deserialize("[1,2]"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":""})"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":7})"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":{"x":1},"method":"initialize"})"));
}

//==========================================================================================================
// Responses carry exactly one of result or error on the wire.
//==========================================================================================================
TEST(JSONRPCResponse, SerializesResultOrError) {
    JSONValue::Object r;
    r["ok"] = std::make_shared<JSONValue>(true);
    JSONRPCResponse ok(JSONRPCId{static_cast<int64_t>(5)}, JSONValue{r});
    EXPECT_EQ(ok.Serialize(), "{\"jsonrpc\":\"2.0\",\"id\":5,\"result\":{\"ok\":true}}");

    auto err = CreateErrorResponse(JSONRPCId{std::string("x")}, JSONRPCErrorCodes::MethodNotFound, "Method not found: foo");
    EXPECT_EQ(err->Serialize(),
              "{\"jsonrpc\":\"2.0\",\"id\":\"x\",\"error\":{\"code\":-32601,\"message\":\"Method not found: foo\"}}");

    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(err->Serialize()));
    EXPECT_TRUE(parsed.IsError());
    EXPECT_FALSE(parsed.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
}
