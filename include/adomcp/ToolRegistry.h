//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name -> (tool metadata, handler) mapping populated at startup
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "adomcp/Protocol.h"

namespace adomcp {

// A handler reports failure by throwing; what() becomes the tool-error text.
using ToolHandler = std::function<CallToolResult(const JSONValue& arguments)>;

//==========================================================================================================
// ToolRegistry
// Purpose: Holds every registered tool and its handler.
// Notes:
//   Populated before the server starts and read-only afterwards, so lookups take no lock.
//==========================================================================================================
class ToolRegistry {
public:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };

    //==========================================================================================================
    // Registers a tool with its handler.
    // Args:
    //   tool: Tool metadata (name, description, inputSchema).
    //   handler: Callable invoked for tools/call.
    // Throws:
    //   std::invalid_argument when the name is empty, already registered, or the handler is empty.
    //==========================================================================================================
    void Register(Tool tool, ToolHandler handler);

    //==========================================================================================================
    // Looks up a tool by name.
    // Returns:
    //   Pointer to the entry, or nullptr when no tool has that name.
    //==========================================================================================================
    const Entry* Find(const std::string& name) const;

    // Tool metadata sorted by name.
    std::vector<Tool> List() const;

    std::size_t Size() const { return entries.size(); }

private:
    std::map<std::string, Entry> entries;
};

} // namespace adomcp
