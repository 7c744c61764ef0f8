//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/azuredevops/ResourceUrl.cpp
// Purpose: Build/release link parsing
//==========================================================================================================

#include <charconv>
#include <memory>
#include <optional>
#include <stdexcept>

#include "adomcp/UrlUtil.h"
#include "adomcp/azuredevops/ResourceUrl.hpp"

namespace adomcp::azuredevops {

namespace {

constexpr const char* kUnparsable = "could not parse build or release info from URL";

std::optional<int64_t> parseId(const std::string& text) {
    std::size_t start = (!text.empty() && text[0] == '+') ? 1 : 0;
    if (start == text.size()) {
        return std::nullopt;
    }
    int64_t v = 0;
    const char* first = text.data() + start;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return v;
}

//==========================================================================================================
// Matches one resource kind: the path must contain marker and the query must carry a numeric idKey.
//==========================================================================================================
std::optional<ParsedResource> match(const UrlParts& u, const std::string& marker, const char* idKey, ResourceType type) {
    const std::size_t at = u.path.find(marker);
    if (at == std::string::npos) {
        return std::nullopt;
    }
    auto id = parseId(GetQueryParameter(u.query, idKey));
    if (!id) {
        return std::nullopt;
    }
    std::string prefix = u.path.substr(0, at);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    const std::size_t slash = prefix.rfind('/');
    const std::string segment = slash == std::string::npos ? prefix : prefix.substr(slash + 1);

    ParsedResource r;
    r.type = type;
    r.project = PercentDecode(segment, true);
    r.id = *id;
    return r;
}

} // namespace

const char* ToString(ResourceType type) {
    switch (type) {
        case ResourceType::Build: return "build";
        case ResourceType::Release: return "release";
    }
    return "unknown";
}

JSONValue ParsedResource::ToJSON() const {
    JSONValue::Object o;
    o["type"] = std::make_shared<JSONValue>(ToString(type));
    o["project"] = std::make_shared<JSONValue>(project);
    o["id"] = std::make_shared<JSONValue>(id);
    return JSONValue{std::move(o)};
}

ParsedResource ParseResourceUrl(const std::string& url) {
    UrlParts u;
    try {
        u = ParseUrl(url);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(kUnparsable);
    }
    if (auto build = match(u, "/_build", "buildId", ResourceType::Build)) {
        return *build;
    }
    if (auto release = match(u, "/_release", "releaseId", ResourceType::Release)) {
        return *release;
    }
    throw std::invalid_argument(kUnparsable);
}

} // namespace adomcp::azuredevops
