//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.hpp
// Purpose: Azure DevOps (Server / Services) REST client for builds, releases and their logs
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "adomcp/azuredevops/Types.hpp"

namespace adomcp::azuredevops {

//==========================================================================================================
// IAzureDevOpsClient
// Purpose: Backend operations exposed as MCP tools. An empty project selects the configured default.
// Notes:
//   Implementations throw AzureDevOpsError (or std::exception subclasses) on failure and must be safe to
//   call from several dispatch tasks at once.
//==========================================================================================================
class IAzureDevOpsClient {
public:
    virtual ~IAzureDevOpsClient() = default;

    virtual std::vector<Build> GetBuilds(const std::string& project, int top) = 0;
    virtual Build GetBuild(const std::string& project, int64_t buildId) = 0;
    virtual std::string GetBuildLogs(const std::string& project, int64_t buildId) = 0;

    virtual std::vector<Release> GetReleases(const std::string& project, int top) = 0;
    virtual Release GetRelease(const std::string& project, int64_t releaseId) = 0;
    virtual std::string GetReleaseLogs(const std::string& project, int64_t releaseId) = 0;
};

//==========================================================================================================
// AzureDevOpsClient
// Purpose: IAzureDevOpsClient over HTTP(S) using Boost.Beast; one short-lived connection per request.
// Notes:
//   - Resource URLs are "<baseUrl>/<project>/_apis/<path>", or "<baseUrl>/_apis/<path>" without a project.
//   - Requests carry "Authorization: Basic base64(':' + token)" (personal access token).
//   - HTTPS verifies the peer against the system trust store (or caFile) with TLS 1.2 or newer.
//==========================================================================================================
class AzureDevOpsClient : public IAzureDevOpsClient {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   baseUrl: Collection URL, e.g. https://dev.azure.com/org or https://tfs.local/tfs/DefaultCollection
    //   organization: Informational; the organization is expected to be part of baseUrl
    //   project: Default project used when a call passes an empty project
    //   token: Personal access token
    //   caFile: Optional PEM bundle used instead of the system trust store
    //   connectTimeoutMs / readTimeoutMs: Per-request timeouts
    //==========================================================================================================
    struct Options {
        std::string baseUrl;
        std::string organization;
        std::string project;
        std::string token;
        std::string caFile;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{60000};
    };

    explicit AzureDevOpsClient(const Options& opts);
    ~AzureDevOpsClient() override;

    AzureDevOpsClient(const AzureDevOpsClient&) = delete;
    AzureDevOpsClient& operator=(const AzureDevOpsClient&) = delete;

    std::vector<Build> GetBuilds(const std::string& project, int top) override;
    Build GetBuild(const std::string& project, int64_t buildId) override;

    //==========================================================================================================
    // Lists the build's logs and concatenates them as "--- Log ID <n> ---\n<content>\n".
    // Notes:
    //   A log that cannot be fetched is skipped with a warning; failing to list the logs throws.
    //==========================================================================================================
    std::string GetBuildLogs(const std::string& project, int64_t buildId) override;

    std::vector<Release> GetReleases(const std::string& project, int top) override;
    Release GetRelease(const std::string& project, int64_t releaseId) override;

    //==========================================================================================================
    // Walks environments -> deploy steps -> phases -> jobs -> tasks of the release and fetches each
    // task's logUrl. Output: "=== Environment: <name> ===\n" per environment, then
    // "--- Task: <name> ---\n<content>\n" per task with a log. Unfetchable task logs are skipped.
    //==========================================================================================================
    std::string GetReleaseLogs(const std::string& project, int64_t releaseId) override;

    // Absolute URL for a REST path below _apis (path may carry a query string).
    std::string ResourceUrl(const std::string& project, const std::string& path) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace adomcp::azuredevops
