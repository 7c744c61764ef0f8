//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/ToolRegistry.cpp
// Purpose: Tool registration and lookup
//==========================================================================================================

#include <stdexcept>

#include "adomcp/ToolRegistry.h"
#include "logging/Logger.h"

namespace adomcp {

void ToolRegistry::Register(Tool tool, ToolHandler handler) {
    if (tool.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("tool '" + tool.name + "' has no handler");
    }
    if (entries.count(tool.name) != 0) {
        throw std::invalid_argument("tool '" + tool.name + "' is already registered");
    }
    LOG_DEBUG("Registering tool: {}", tool.name);
    std::string name = tool.name;
    entries.emplace(std::move(name), Entry{std::move(tool), std::move(handler)});
}

const ToolRegistry::Entry* ToolRegistry::Find(const std::string& name) const {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : &it->second;
}

std::vector<Tool> ToolRegistry::List() const {
    std::vector<Tool> tools;
    tools.reserve(entries.size());
    for (const auto& [name, entry] : entries) tools.push_back(entry.tool);
    return tools;
}

} // namespace adomcp
