//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Tools.hpp
// Purpose: MCP tool adapters over the Azure DevOps client
//==========================================================================================================

#pragma once

#include <memory>

#include "adomcp/ToolRegistry.h"
#include "adomcp/azuredevops/Client.hpp"

namespace adomcp::azuredevops {

// Default number of records returned by the list tools
constexpr int kDefaultTop = 10;
constexpr int kMaxTop = 1000;

//==========================================================================================================
// Registers the Azure DevOps tools:
//   list_builds      {top?, project?}          -> pretty-printed JSON array of builds
//   get_build        {buildId, project?}       -> pretty-printed JSON build
//   get_build_logs   {buildId, project?}       -> concatenated build logs
//   list_releases    {top?, project?}          -> pretty-printed JSON array of releases
//   get_release      {releaseId, project?}     -> pretty-printed JSON release
//   get_release_logs {releaseId, project?}     -> concatenated release task logs
//   parse_url        {url}                     -> {"type","project","id"} of a build/release web link
// Args:
//   registry: Target registry.
//   client: Backend; shared by all handlers.
// Notes:
//   Argument errors and backend failures surface as exceptions, which the dispatcher reports as
//   isError=true tool results.
//==========================================================================================================
void RegisterAzureDevOpsTools(ToolRegistry& registry, std::shared_ptr<IAzureDevOpsClient> client);

} // namespace adomcp::azuredevops
