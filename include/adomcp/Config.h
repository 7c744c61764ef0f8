//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Process configuration from .env, environment variables and --key=value flags
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "adomcp/SessionDirectory.h"

namespace adomcp {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ServerConfig
// Fields:
//   address / port: Listener (ADOMCP_ADDRESS, PORT; --address, --port)
//   queueCapacity: Per-session outbound queue bound (ADOMCP_QUEUE_CAPACITY; --queue-capacity)
//   adoUrl / adoOrganization / adoProject / adoToken: Backend (ADO_URL, ADO_ORG, ADO_PROJECT, ADO_TOKEN)
//   logLevel / logFile: Logger setup (ADOMCP_LOG_LEVEL, ADOMCP_LOG_FILE; --log-level, --log-file)
//   envFile: .env file read before the environment is consulted (--env-file)
//==========================================================================================================
struct ServerConfig {
    std::string address{"0.0.0.0"};
    std::string port{"8080"};
    std::size_t queueCapacity{kDefaultQueueCapacity};

    std::string adoUrl;
    std::string adoOrganization;
    std::string adoProject;
    std::string adoToken;

    std::string logLevel{"INFO"};
    std::string logFile;
    std::string envFile{".env"};
};

//==========================================================================================================
// Returns the value of "--key=value" or "--key value" from argv, or nullopt when the option is absent.
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

//==========================================================================================================
// LoadConfig
// Purpose: Loads the .env file (existing environment variables win), then reads the environment, then
// applies command-line flags (flags win).
// Throws:
//   ConfigError when ADO_URL or ADO_TOKEN is missing, or the port or queue capacity is invalid.
//==========================================================================================================
ServerConfig LoadConfig(int argc, char** argv);

} // namespace adomcp
