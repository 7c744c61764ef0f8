//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: adomcp server entry point (MCP over SSE in front of Azure DevOps)
//==========================================================================================================

#include <csignal>
#include <exception>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "adomcp/Config.h"
#include "adomcp/Dispatcher.h"
#include "adomcp/Protocol.h"
#include "adomcp/SSEServer.hpp"
#include "adomcp/SessionDirectory.h"
#include "adomcp/ToolRegistry.h"
#include "adomcp/azuredevops/Client.hpp"
#include "adomcp/azuredevops/Tools.hpp"

using namespace adomcp;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig cfg;
    try {
        cfg = LoadConfig(argc, argv);
    } catch (const ConfigError& e) {
        LOG_FATAL("Configuration error: {}", e.what());
    }
    Logger::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }

    azuredevops::AzureDevOpsClient::Options clientOpts;
    clientOpts.baseUrl = cfg.adoUrl;
    clientOpts.organization = cfg.adoOrganization;
    clientOpts.project = cfg.adoProject;
    clientOpts.token = cfg.adoToken;

    ToolRegistry tools;
    std::shared_ptr<azuredevops::AzureDevOpsClient> client;
    try {
        client = std::make_shared<azuredevops::AzureDevOpsClient>(clientOpts);
        azuredevops::RegisterAzureDevOpsTools(tools, client);
    } catch (const std::exception& e) {
        LOG_FATAL("Failed to set up Azure DevOps client: {}", e.what());
    }
    LOG_INFO("Azure DevOps backend {} (default project: '{}'), {} tools registered",
             cfg.adoUrl, cfg.adoProject, tools.Size());

    // Declaration order is teardown order in reverse: server first, then dispatcher, then sessions
    SessionDirectory sessions(cfg.queueCapacity);
    Dispatcher dispatcher(tools, sessions, Implementation{SERVER_NAME, SERVER_VERSION});

    SSEServer::Options serverOpts;
    serverOpts.address = cfg.address;
    serverOpts.port = cfg.port;
    SSEServer server(serverOpts, sessions, dispatcher);

    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_FATAL("Failed to start MCP server on {}:{}: {}", cfg.address, cfg.port, e.what());
    }
    LOG_INFO("Starting MCP server on port {}...", server.BoundPort());

    boost::asio::io_context signals;
    boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);
    stopSignals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}; shutting down", signo);
        }
    });
    signals.run();

    server.Stop().get();
    dispatcher.WaitForIdle();
    LOG_INFO("Shutdown complete");
    return 0;
}
