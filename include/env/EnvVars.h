//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and to seed them from a .env file.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? std::string(v) : defaultValue;
}

//==========================================================================================================
// ParseDotEnv
// Purpose: Parses .env file content into ordered key/value pairs.
// Notes:
//   - Blank lines and lines starting with '#' are skipped; an optional leading "export " is ignored.
//   - Values may be wrapped in single or double quotes; double-quoted values understand \n, \t, \" and \\.
//   - Unquoted values end at an inline " #" comment and are trimmed.
//   - Lines without '=' or with an empty key are ignored.
//==========================================================================================================
std::vector<std::pair<std::string, std::string>> ParseDotEnv(const std::string& content);

//==========================================================================================================
// LoadDotEnvFile
// Purpose: Reads a .env file and exports its entries into the process environment.
// Args:
//   path: File to read.
//   overwrite: When false (default) variables already present in the environment win.
// Returns:
//   Number of variables exported; -1 when the file cannot be opened (a missing .env is not an error).
//==========================================================================================================
int LoadDotEnvFile(const std::string& path, bool overwrite = false);
