//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/azuredevops/Types.cpp
// Purpose: JSON mapping for Azure DevOps records
//==========================================================================================================

#include <cmath>
#include <memory>

#include "adomcp/azuredevops/Types.hpp"

namespace adomcp::azuredevops {

namespace {

std::string stringMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (v != nullptr && v->IsString()) {
        return std::get<std::string>(v->value);
    }
    return std::string();
}

int64_t integerMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (v == nullptr) {
        return 0;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        const double d = std::get<double>(v->value);
        return std::isfinite(d) ? static_cast<int64_t>(d) : 0;
    }
    return 0;
}

std::string nestedName(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    return v != nullptr ? stringMember(*v, "name") : std::string();
}

void requireObject(const JSONValue& v, const char* what) {
    if (!v.IsObject()) {
        throw AzureDevOpsError(std::string("unexpected ") + what + " payload: expected a JSON object");
    }
}

void put(JSONValue::Object& obj, const char* key, const std::string& value) {
    obj[key] = std::make_shared<JSONValue>(value);
}

JSONValue namedObject(const std::string& name) {
    JSONValue::Object o;
    put(o, "name", name);
    return JSONValue{std::move(o)};
}

} // namespace

Build Build::FromJSON(const JSONValue& v) {
    requireObject(v, "build");
    Build b;
    b.id = integerMember(v, "id");
    b.buildNumber = stringMember(v, "buildNumber");
    b.status = stringMember(v, "status");
    b.result = stringMember(v, "result");
    b.startTime = stringMember(v, "startTime");
    b.finishTime = stringMember(v, "finishTime");
    b.url = stringMember(v, "url");
    b.definitionName = nestedName(v, "definition");
    return b;
}

JSONValue Build::ToJSON() const {
    JSONValue::Object o;
    o["id"] = std::make_shared<JSONValue>(id);
    put(o, "buildNumber", buildNumber);
    put(o, "status", status);
    put(o, "result", result);
    put(o, "startTime", startTime);
    put(o, "finishTime", finishTime);
    put(o, "url", url);
    o["definition"] = std::make_shared<JSONValue>(namedObject(definitionName));
    return JSONValue{std::move(o)};
}

Release Release::FromJSON(const JSONValue& v) {
    requireObject(v, "release");
    Release r;
    r.id = integerMember(v, "id");
    r.name = stringMember(v, "name");
    r.status = stringMember(v, "status");
    r.createdOn = stringMember(v, "createdOn");
    r.description = stringMember(v, "description");
    r.releaseDefinitionName = nestedName(v, "releaseDefinition");
    return r;
}

JSONValue Release::ToJSON() const {
    JSONValue::Object o;
    o["id"] = std::make_shared<JSONValue>(id);
    put(o, "name", name);
    put(o, "status", status);
    put(o, "createdOn", createdOn);
    put(o, "description", description);
    o["releaseDefinition"] = std::make_shared<JSONValue>(namedObject(releaseDefinitionName));
    return JSONValue{std::move(o)};
}

} // namespace adomcp::azuredevops
