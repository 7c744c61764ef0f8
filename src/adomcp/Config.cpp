//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/Config.cpp
// Purpose: Configuration loading and validation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>

#include "adomcp/Config.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace adomcp {

namespace {

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

void validatePort(const std::string& port) {
    unsigned long value = 0;
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (!allDigits(port) || ec != std::errc() || ptr != port.data() + port.size() || value > 65535ul) {
        throw ConfigError("invalid port '" + port + "': expected a number between 0 and 65535");
    }
}

std::size_t parseCapacity(const std::string& text) {
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (!allDigits(text) || ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
        throw ConfigError("invalid queue capacity '" + text + "': expected a positive integer");
    }
    return value;
}

} // namespace

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string a = argv[i];
        if (a == key) {
            if (i + 1 < argc && argv[i + 1] != nullptr) {
                return std::string(argv[i + 1]);
            }
            return std::string();
        }
        if (a.size() > key.size() && a.compare(0, key.size(), key) == 0 && a[key.size()] == '=') {
            return a.substr(key.size() + 1);
        }
    }
    return std::nullopt;
}

ServerConfig LoadConfig(int argc, char** argv) {
    ServerConfig cfg;
    cfg.envFile = GetArgValue(argc, argv, "--env-file").value_or(cfg.envFile);

    const int loaded = LoadDotEnvFile(cfg.envFile);
    if (loaded >= 0) {
        LOG_DEBUG("Loaded {} variable(s) from {}", loaded, cfg.envFile);
    }

    cfg.port = GetEnvOrDefault("PORT", cfg.port);
    cfg.address = GetEnvOrDefault("ADOMCP_ADDRESS", cfg.address);
    const std::string capacityEnv = GetEnvOrDefault("ADOMCP_QUEUE_CAPACITY", "");
    cfg.adoUrl = GetEnvOrDefault("ADO_URL", "");
    cfg.adoOrganization = GetEnvOrDefault("ADO_ORG", "");
    cfg.adoProject = GetEnvOrDefault("ADO_PROJECT", "");
    cfg.adoToken = GetEnvOrDefault("ADO_TOKEN", "");
    cfg.logLevel = GetEnvOrDefault("ADOMCP_LOG_LEVEL", cfg.logLevel);
    cfg.logFile = GetEnvOrDefault("ADOMCP_LOG_FILE", cfg.logFile);

    cfg.port = GetArgValue(argc, argv, "--port").value_or(cfg.port);
    cfg.address = GetArgValue(argc, argv, "--address").value_or(cfg.address);
    const std::string capacity = GetArgValue(argc, argv, "--queue-capacity").value_or(capacityEnv);
    cfg.logLevel = GetArgValue(argc, argv, "--log-level").value_or(cfg.logLevel);
    cfg.logFile = GetArgValue(argc, argv, "--log-file").value_or(cfg.logFile);

    validatePort(cfg.port);
    if (!capacity.empty()) {
        cfg.queueCapacity = parseCapacity(capacity);
    }
    if (cfg.address.empty()) {
        throw ConfigError("listen address must not be empty");
    }
    if (cfg.adoUrl.empty() || cfg.adoToken.empty()) {
        throw ConfigError("ADO_URL and ADO_TOKEN environment variables are required");
    }
    return cfg;
}

} // namespace adomcp
