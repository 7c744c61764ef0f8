//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Types.hpp
// Purpose: Azure DevOps build and release records as returned by the REST API
//==========================================================================================================

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "adomcp/JSONRPCTypes.h"

namespace adomcp::azuredevops {

//==========================================================================================================
// AzureDevOpsError
// Purpose: Failure talking to Azure DevOps (transport error, non-2xx status, unexpected payload).
// Fields:
//   status: HTTP status when the server answered; 0 for transport or decoding failures.
//==========================================================================================================
class AzureDevOpsError : public std::runtime_error {
public:
    explicit AzureDevOpsError(const std::string& what, unsigned int status = 0)
        : std::runtime_error(what), status(status) {}
    unsigned int status;
};

//==========================================================================================================
// Build
// Purpose: Subset of a build resource. JSON names match the REST payload
// (id, buildNumber, status, result, startTime, finishTime, url, definition.name).
//==========================================================================================================
struct Build {
    int64_t id{0};
    std::string buildNumber;
    std::string status;
    std::string result;
    std::string startTime;
    std::string finishTime;
    std::string url;
    std::string definitionName;

    // Missing or mistyped members keep their defaults; throws AzureDevOpsError when v is not an object.
    static Build FromJSON(const JSONValue& v);
    JSONValue ToJSON() const;
};

//==========================================================================================================
// Release
// Purpose: Subset of a release resource (id, name, status, createdOn, description, releaseDefinition.name).
//==========================================================================================================
struct Release {
    int64_t id{0};
    std::string name;
    std::string status;
    std::string createdOn;
    std::string description;
    std::string releaseDefinitionName;

    static Release FromJSON(const JSONValue& v);
    JSONValue ToJSON() const;
};

} // namespace adomcp::azuredevops
