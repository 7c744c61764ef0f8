//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/UrlUtil.cpp
// Purpose: URL parsing, query lookup and percent coding
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "adomcp/UrlUtil.h"

namespace adomcp {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string UrlParts::Target() const {
    if (query.empty()) {
        return path;
    }
    return path + "?" + query;
}

UrlParts ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = toLower(url.substr(0, schemeEnd));
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme: " + parts.scheme);
    }

    // Authority ends at the first '/', '?' or '#'
    std::size_t authEnd = url.find_first_of("/?#", pos);
    std::string hostPort = url.substr(pos, authEnd == std::string::npos ? std::string::npos : authEnd - pos);
    std::string rest = authEnd == std::string::npos ? std::string() : url.substr(authEnd);

    // Drop userinfo if someone pasted credentials into the URL
    std::size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        std::size_t rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("malformed IPv6 host in URL: " + url);
        }
        parts.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            parts.port = hostPort.substr(rb + 2);
        }
    } else {
        std::size_t colon = hostPort.rfind(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    if (parts.port.empty()) {
        parts.port = parts.scheme == "https" ? "443" : "80";
    }

    std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }
    SplitTarget(rest, parts.path, parts.query);
    if (parts.path.empty()) {
        parts.path = "/";
    }
    return parts;
}

void SplitTarget(const std::string& target, std::string& path, std::string& query) {
    std::size_t q = target.find('?');
    if (q == std::string::npos) {
        path = target;
        query.clear();
    } else {
        path = target.substr(0, q);
        query = target.substr(q + 1);
    }
}

std::string PercentDecode(const std::string& in, bool plusAsSpace) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            const int hi = hexValue(in[i + 1]);
            const int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string PercentEncode(const std::string& in) {
    static const char* kHex = "0123456789ABCDEF";
    std::ostringstream oss;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << kHex[(c >> 4) & 0xF] << kHex[c & 0xF];
        }
    }
    return oss.str();
}

std::string GetQueryParameter(const std::string& query, const std::string& key) {
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        auto eq = kv.find('=');
        std::string k = PercentDecode(eq == std::string::npos ? kv : kv.substr(0, eq), true);
        if (k != key) {
            continue;
        }
        return eq == std::string::npos ? std::string() : PercentDecode(kv.substr(eq + 1), true);
    }
    return std::string();
}

} // namespace adomcp
