//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/azuredevops/Tools.cpp
// Purpose: Tool schemas, argument decoding and result rendering for Azure DevOps operations
//==========================================================================================================

#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "adomcp/ToolArguments.h"
#include "adomcp/azuredevops/ResourceUrl.hpp"
#include "adomcp/azuredevops/Tools.hpp"

namespace adomcp::azuredevops {

namespace {

struct ListArgs {
    std::string project;
    int top{kDefaultTop};
};

struct BuildArgs {
    std::string project;
    int64_t buildId{0};
};

struct ReleaseArgs {
    std::string project;
    int64_t releaseId{0};
};

ListArgs decodeList(const JSONValue& raw) {
    ToolArguments args(raw);
    ListArgs out;
    out.project = args.OptionalString("project").value_or("");
    out.top = static_cast<int>(ToolArguments::CheckRange("top", args.OptionalInteger("top", kDefaultTop), 1, kMaxTop));
    return out;
}

BuildArgs decodeBuild(const JSONValue& raw) {
    ToolArguments args(raw);
    BuildArgs out;
    out.buildId = args.RequireInteger("buildId");
    out.project = args.OptionalString("project").value_or("");
    return out;
}

ReleaseArgs decodeRelease(const JSONValue& raw) {
    ToolArguments args(raw);
    ReleaseArgs out;
    out.releaseId = args.RequireInteger("releaseId");
    out.project = args.OptionalString("project").value_or("");
    return out;
}

//----------------------------------------------------------------------------------------------------------
// Schema helpers
//----------------------------------------------------------------------------------------------------------
std::shared_ptr<JSONValue> property(const char* type, const char* description) {
    JSONValue::Object p;
    p["type"] = std::make_shared<JSONValue>(type);
    p["description"] = std::make_shared<JSONValue>(description);
    return std::make_shared<JSONValue>(std::move(p));
}

JSONValue objectSchema(JSONValue::Object props, std::initializer_list<const char*> required) {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(props));
    if (required.size() > 0) {
        JSONValue::Array req;
        for (const char* name : required) {
            req.push_back(std::make_shared<JSONValue>(name));
        }
        schema["required"] = std::make_shared<JSONValue>(std::move(req));
    }
    return JSONValue{std::move(schema)};
}

JSONValue listSchema(const char* what) {
    JSONValue::Object props;
    props["top"] = property("integer", (std::string("Number of ") + what + " to retrieve (default 10)").c_str());
    props["project"] = property("string", "Project name (optional, overrides default)");
    return objectSchema(std::move(props), {});
}

JSONValue idSchema(const char* idName, const char* description) {
    JSONValue::Object props;
    props[idName] = property("integer", description);
    props["project"] = property("string", "Project name (optional, overrides default)");
    return objectSchema(std::move(props), {idName});
}

template <class Record>
CallToolResult jsonArrayResult(const std::vector<Record>& records) {
    JSONValue::Array arr;
    arr.reserve(records.size());
    for (const auto& r : records) {
        arr.push_back(std::make_shared<JSONValue>(r.ToJSON()));
    }
    return CallToolResult::Text(SerializeJSONValue(JSONValue{std::move(arr)}, 2));
}

CallToolResult jsonResult(const JSONValue& value) {
    return CallToolResult::Text(SerializeJSONValue(value, 2));
}

} // namespace

void RegisterAzureDevOpsTools(ToolRegistry& registry, std::shared_ptr<IAzureDevOpsClient> client) {
    if (!client) {
        throw std::invalid_argument("RegisterAzureDevOpsTools: client is null");
    }

    registry.Register(Tool{"list_builds", "List recent builds", listSchema("builds")},
        [client](const JSONValue& raw) {
            const ListArgs a = decodeList(raw);
            return jsonArrayResult(client->GetBuilds(a.project, a.top));
        });

    registry.Register(Tool{"get_build", "Get build details", idSchema("buildId", "Build ID")},
        [client](const JSONValue& raw) {
            const BuildArgs a = decodeBuild(raw);
            return jsonResult(client->GetBuild(a.project, a.buildId).ToJSON());
        });

    registry.Register(Tool{"get_build_logs", "Get build logs", idSchema("buildId", "Build ID")},
        [client](const JSONValue& raw) {
            const BuildArgs a = decodeBuild(raw);
            return CallToolResult::Text(client->GetBuildLogs(a.project, a.buildId));
        });

    registry.Register(Tool{"list_releases", "List recent releases", listSchema("releases")},
        [client](const JSONValue& raw) {
            const ListArgs a = decodeList(raw);
            return jsonArrayResult(client->GetReleases(a.project, a.top));
        });

    registry.Register(Tool{"get_release", "Get release details", idSchema("releaseId", "Release ID")},
        [client](const JSONValue& raw) {
            const ReleaseArgs a = decodeRelease(raw);
            return jsonResult(client->GetRelease(a.project, a.releaseId).ToJSON());
        });

    registry.Register(Tool{"get_release_logs", "Get release logs", idSchema("releaseId", "Release ID")},
        [client](const JSONValue& raw) {
            const ReleaseArgs a = decodeRelease(raw);
            return CallToolResult::Text(client->GetReleaseLogs(a.project, a.releaseId));
        });

    JSONValue::Object urlProps;
    urlProps["url"] = property("string", "Azure DevOps build or release web URL");
    registry.Register(Tool{"parse_url", "Extract project and build/release ID from an Azure DevOps URL",
                           objectSchema(std::move(urlProps), {"url"})},
        [](const JSONValue& raw) {
            ToolArguments args(raw);
            return jsonResult(ParseResourceUrl(args.RequireString("url")).ToJSON());
        });
}

} // namespace adomcp::azuredevops
