//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the dispatcher
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>

namespace adomcp {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version negotiated by initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Server identity reported by initialize
constexpr const char* SERVER_NAME = "adomcp";
constexpr const char* SERVER_VERSION = "1.0.0";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool structures
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolParams {
    std::string name;
    JSONValue arguments;
};

//==========================================================================================================
// CallToolResult
// Purpose: Ordered content blocks plus the tool-level error flag.
// Notes:
//   isError=true means the call was valid but the operation failed; it is still a JSON-RPC success.
//==========================================================================================================
struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;

    static CallToolResult Text(const std::string& text);
    static CallToolResult Error(const std::string& message);
};

// Builds { "type": "text", "text": text }
JSONValue MakeTextContent(const std::string& text);

// Wire form of a Tool for tools/list: { name, description, inputSchema }
JSONValue ToolToJSON(const Tool& tool);

// Wire form of a CallToolResult: { content: [...], isError }
JSONValue CallToolResultToJSON(const CallToolResult& result);

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* NotificationPrefix = "notifications/";
    constexpr const char* Initialized = "notifications/initialized";
}

} // namespace adomcp
