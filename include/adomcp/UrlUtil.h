//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UrlUtil.h
// Purpose: Small URL helpers shared by the HTTP server and the Azure DevOps client
//==========================================================================================================

#pragma once

#include <string>

namespace adomcp {

//==========================================================================================================
// UrlParts
// Fields:
//   scheme: "http" or "https" (lowercased; "http" when the URL carries none)
//   host: Host name or address without brackets
//   port: Explicit port, or the scheme default ("80"/"443")
//   path: Path starting with '/', without the query ("/" when absent)
//   query: Raw query string without the leading '?'
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;

    // path plus "?query" when a query is present; suitable as an HTTP request target
    std::string Target() const;
};

//==========================================================================================================
// Splits an absolute URL into its components.
// Throws:
//   std::invalid_argument when the scheme is not http/https or the host is empty.
//==========================================================================================================
UrlParts ParseUrl(const std::string& url);

// Splits a request target "path?query" at the first '?'.
void SplitTarget(const std::string& target, std::string& path, std::string& query);

//==========================================================================================================
// Decodes %XX escapes and, when plusAsSpace is set, '+' as a space (form/query encoding).
// Malformed escapes are kept verbatim.
//==========================================================================================================
std::string PercentDecode(const std::string& in, bool plusAsSpace = false);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string PercentEncode(const std::string& in);

//==========================================================================================================
// Returns the decoded value of the first query parameter named key, or "" when absent.
//==========================================================================================================
std::string GetQueryParameter(const std::string& query, const std::string& key);

} // namespace adomcp
