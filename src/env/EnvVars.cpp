//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/env/EnvVars.cpp
// Purpose: .env parsing and loading.
//==========================================================================================================

#include <cctype>
#include <fstream>
#include <sstream>

#include "env/EnvVars.h"

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string unquoteDouble(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\' && i + 1 < raw.size()) {
            char n = raw[++i];
            switch (n) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                default: out.push_back('\\'); out.push_back(n); break;
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::vector<std::pair<std::string, std::string>> ParseDotEnv(const std::string& content) {
    std::vector<std::pair<std::string, std::string>> entries;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }
        if (t.rfind("export ", 0) == 0) {
            t = trim(t.substr(7));
        }
        auto eq = t.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(t.substr(0, eq));
        std::string value = trim(t.substr(eq + 1));
        if (key.empty()) {
            continue;
        }
        if (value.size() >= 2 && value.front() == '"') {
            auto close = value.rfind('"');
            value = (close > 0) ? unquoteDouble(value.substr(1, close - 1)) : value.substr(1);
        } else if (value.size() >= 2 && value.front() == '\'') {
            auto close = value.rfind('\'');
            value = (close > 0) ? value.substr(1, close - 1) : value.substr(1);
        } else {
            auto hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }
        entries.emplace_back(std::move(key), std::move(value));
    }
    return entries;
}

int LoadDotEnvFile(const std::string& path, bool overwrite) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return -1;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    int exported = 0;
    for (const auto& [key, value] : ParseDotEnv(ss.str())) {
        if (!overwrite && std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++exported;
        }
    }
    return exported;
}
