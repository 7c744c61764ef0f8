//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/Protocol.cpp
// Purpose: Wire-shape builders for protocol structures
//==========================================================================================================

#include "adomcp/Protocol.h"

namespace adomcp {

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object content;
    content["type"] = std::make_shared<JSONValue>(std::string("text"));
    content["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{std::move(content)};
}

CallToolResult CallToolResult::Text(const std::string& text) {
    CallToolResult tr;
    tr.content.push_back(MakeTextContent(text));
    return tr;
}

CallToolResult CallToolResult::Error(const std::string& message) {
    CallToolResult tr = Text(message);
    tr.isError = true;
    return tr;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    if (tool.inputSchema.IsNull()) {
        // Clients expect an object schema even for argument-less tools
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>(std::string("object"));
        obj["inputSchema"] = std::make_shared<JSONValue>(JSONValue{std::move(schema)});
    } else {
        obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    }
    return JSONValue{std::move(obj)};
}

JSONValue CallToolResultToJSON(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    content.reserve(result.content.size());
    for (const auto& v : result.content) content.push_back(std::make_shared<JSONValue>(v));
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue{std::move(obj)};
}

} // namespace adomcp
