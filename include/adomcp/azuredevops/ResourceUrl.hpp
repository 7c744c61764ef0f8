//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceUrl.hpp
// Purpose: Recognizes Azure DevOps web links to builds and releases
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>

#include "adomcp/JSONRPCTypes.h"

namespace adomcp::azuredevops {

enum class ResourceType {
    Build,
    Release
};

// "build" or "release"
const char* ToString(ResourceType type);

struct ParsedResource {
    ResourceType type{ResourceType::Build};
    std::string project;  // may be empty when the link carries no project segment
    int64_t id{0};

    // {"type": "build"|"release", "project": ..., "id": ...}
    JSONValue ToJSON() const;
};

//==========================================================================================================
// Parses links such as
//   https://host/Collection/My%20Project/_build/results?buildId=42&view=logs
//   https://host/Collection/My%20Project/_release?_a=release-summary&releaseId=7
// The project is the path segment right before "/_build" or "/_release", percent-decoded.
// Throws:
//   std::invalid_argument("could not parse build or release info from URL") for anything else.
//==========================================================================================================
ParsedResource ParseResourceUrl(const std::string& url);

} // namespace adomcp::azuredevops
