//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/azuredevops/Client.cpp
// Purpose: Azure DevOps REST client using Boost.Beast (HTTPS via OpenSSL)
//==========================================================================================================

#include <chrono>
#include <exception>
#include <sstream>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/evp.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "adomcp/Protocol.h"
#include "adomcp/UrlUtil.h"
#include "adomcp/azuredevops/Client.hpp"

namespace adomcp::azuredevops {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kApiVersion = "api-version=6.0";
// Build logs can be large; Beast's default response limit is 8 MiB
constexpr std::uint64_t kMaxResponseBytes = 64ull * 1024ull * 1024ull;

struct Reply {
    unsigned int status{0};
    std::string body;
};

std::string base64Encode(const std::string& in) {
    // EVP_EncodeBlock writes a trailing NUL
    std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
    const int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                    reinterpret_cast<const unsigned char*>(in.data()),
                                    static_cast<int>(in.size()));
    out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
    return out;
}

std::string hostHeader(const UrlParts& u) {
    const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
    const std::string host = u.host.find(':') != std::string::npos ? "[" + u.host + "]" : u.host;
    return defaultPort ? host : host + ":" + u.port;
}

const JSONValue::Array& arrayMember(const JSONValue& obj, const char* key) {
    static const JSONValue::Array kEmpty;
    const JSONValue* v = obj.Find(key);
    if (v != nullptr && v->IsArray()) {
        return std::get<JSONValue::Array>(v->value);
    }
    return kEmpty;
}

std::string stringMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    return (v != nullptr && v->IsString()) ? std::get<std::string>(v->value) : std::string();
}

int64_t idMember(const JSONValue& obj) {
    const JSONValue* v = obj.Find("id");
    if (v != nullptr && std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    return 0;
}

//==========================================================================================================
// Sends one GET on an established stream (plain or TLS) and reads the full response.
//==========================================================================================================
template <class Stream>
net::awaitable<Reply> exchange(Stream& stream, beast::tcp_stream& transport, const UrlParts& u,
                               const std::string& authorization, const std::string& accept,
                               std::chrono::milliseconds readTimeout) {
    http::request<http::empty_body> req{http::verb::get, u.Target(), 11};
    req.set(http::field::host, hostHeader(u));
    req.set(http::field::user_agent, std::string(SERVER_NAME) + "/" + SERVER_VERSION);
    req.set(http::field::accept, accept);
    req.set(http::field::authorization, authorization);
    req.set(http::field::connection, "close");

    transport.expires_after(readTimeout);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBytes);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    Reply reply;
    reply.status = parser.get().result_int();
    reply.body = std::move(parser.get().body());
    co_return reply;
}

} // namespace

class AzureDevOpsClient::Impl {
public:
    AzureDevOpsClient::Options opts;
    std::string baseUrl;
    std::string authorization;
    std::unique_ptr<ssl::context> sslCtx;

    explicit Impl(const AzureDevOpsClient::Options& o) : opts(o) {
        baseUrl = opts.baseUrl;
        while (!baseUrl.empty() && baseUrl.back() == '/') {
            baseUrl.pop_back();
        }
        if (baseUrl.empty()) {
            throw AzureDevOpsError("Azure DevOps base URL is empty");
        }
        authorization = "Basic " + base64Encode(":" + opts.token);

        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        boost::system::error_code ec;
        if (!opts.caFile.empty()) {
            sslCtx->load_verify_file(opts.caFile, ec);
            if (ec) {
                throw AzureDevOpsError("failed to load CA file " + opts.caFile + ": " + ec.message());
            }
        } else {
            sslCtx->set_default_verify_paths(ec);
            if (ec) {
                LOG_WARN("AzureDevOpsClient: system trust store unavailable: {}", ec.message());
            }
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
    }

    std::string url(const std::string& project, const std::string& path) const {
        const std::string& target = project.empty() ? opts.project : project;
        if (target.empty()) {
            return baseUrl + "/_apis/" + path;
        }
        return baseUrl + "/" + PercentEncode(target) + "/_apis/" + path;
    }

    net::awaitable<Reply> coGet(UrlParts u, std::string accept) {
        const auto connectTimeout = std::chrono::milliseconds(opts.connectTimeoutMs);
        const auto readTimeout = std::chrono::milliseconds(opts.readTimeoutMs);
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);

        if (u.scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                throw AzureDevOpsError("failed to set TLS SNI host name " + u.host);
            }
            if (::SSL_set1_host(stream.native_handle(), u.host.c_str()) != 1) {
                throw AzureDevOpsError("failed to set TLS verification host " + u.host);
            }
            stream.next_layer().expires_after(connectTimeout);
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            stream.next_layer().expires_after(readTimeout);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            Reply reply = co_await exchange(stream, stream.next_layer(), u, authorization, accept, readTimeout);

            // Servers often drop the connection without close_notify; the response is already complete
            boost::system::error_code ec;
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            co_return reply;
        }

        beast::tcp_stream stream(executor);
        stream.expires_after(connectTimeout);
        co_await stream.async_connect(results, net::use_awaitable);
        Reply reply = co_await exchange(stream, stream, u, authorization, accept, readTimeout);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return reply;
    }

    //======================================================================================================
    // Runs one request to completion on a private io_context so concurrent callers never share state.
    //======================================================================================================
    Reply get(const std::string& target, const std::string& accept) {
        UrlParts u;
        try {
            u = ParseUrl(target);
        } catch (const std::invalid_argument& e) {
            throw AzureDevOpsError(std::string("invalid Azure DevOps URL: ") + e.what());
        }
        LOG_DEBUG("GET {}", target);

        net::io_context ioc;
        std::exception_ptr failure;
        Reply reply;
        net::co_spawn(ioc, coGet(std::move(u), accept), [&failure, &reply](std::exception_ptr e, Reply r) {
            failure = e;
            reply = std::move(r);
        });
        ioc.run();

        if (failure) {
            try {
                std::rethrow_exception(failure);
            } catch (const boost::system::system_error& e) {
                throw AzureDevOpsError("request to " + target + " failed: " + e.what());
            }
        }
        return reply;
    }

    Reply getChecked(const std::string& target, const std::string& accept) {
        Reply reply = get(target, accept);
        if (reply.status < 200 || reply.status >= 300) {
            throw AzureDevOpsError("API request failed with status " + std::to_string(reply.status) + ": " + reply.body,
                                   reply.status);
        }
        return reply;
    }

    JSONValue getJSON(const std::string& target) {
        Reply reply = getChecked(target, "application/json");
        try {
            return ParseJSONValue(reply.body);
        } catch (const JSONParseError& e) {
            throw AzureDevOpsError("unexpected response from " + target + ": " + e.what());
        }
    }
};

AzureDevOpsClient::AzureDevOpsClient(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

AzureDevOpsClient::~AzureDevOpsClient() = default;

std::string AzureDevOpsClient::ResourceUrl(const std::string& project, const std::string& path) const {
    return pImpl->url(project, path);
}

std::vector<Build> AzureDevOpsClient::GetBuilds(const std::string& project, int top) {
    JSONValue doc = pImpl->getJSON(pImpl->url(project, std::string("build/builds?") + kApiVersion + "&$top=" + std::to_string(top)));
    std::vector<Build> builds;
    for (const auto& item : arrayMember(doc, "value")) {
        if (item) {
            builds.push_back(Build::FromJSON(*item));
        }
    }
    return builds;
}

Build AzureDevOpsClient::GetBuild(const std::string& project, int64_t buildId) {
    return Build::FromJSON(pImpl->getJSON(
        pImpl->url(project, "build/builds/" + std::to_string(buildId) + "?" + kApiVersion)));
}

std::string AzureDevOpsClient::GetBuildLogs(const std::string& project, int64_t buildId) {
    const std::string buildPath = "build/builds/" + std::to_string(buildId) + "/logs";
    JSONValue listing = pImpl->getJSON(pImpl->url(project, buildPath + "?" + kApiVersion));

    std::ostringstream out;
    for (const auto& item : arrayMember(listing, "value")) {
        if (!item) {
            continue;
        }
        const int64_t logId = idMember(*item);
        try {
            Reply log = pImpl->getChecked(
                pImpl->url(project, buildPath + "/" + std::to_string(logId) + "?" + kApiVersion), "text/plain");
            out << "--- Log ID " << logId << " ---\n" << log.body << "\n";
        } catch (const AzureDevOpsError& e) {
            LOG_WARN("Skipping log {} of build {}: {}", logId, buildId, e.what());
        }
    }
    return out.str();
}

std::vector<Release> AzureDevOpsClient::GetReleases(const std::string& project, int top) {
    JSONValue doc = pImpl->getJSON(pImpl->url(project, std::string("release/releases?") + kApiVersion + "&$top=" + std::to_string(top)));
    std::vector<Release> releases;
    for (const auto& item : arrayMember(doc, "value")) {
        if (item) {
            releases.push_back(Release::FromJSON(*item));
        }
    }
    return releases;
}

Release AzureDevOpsClient::GetRelease(const std::string& project, int64_t releaseId) {
    return Release::FromJSON(pImpl->getJSON(
        pImpl->url(project, "release/releases/" + std::to_string(releaseId) + "?" + kApiVersion)));
}

std::string AzureDevOpsClient::GetReleaseLogs(const std::string& project, int64_t releaseId) {
    JSONValue detail = pImpl->getJSON(
        pImpl->url(project, "release/releases/" + std::to_string(releaseId) + "?" + kApiVersion));

    std::ostringstream out;
    for (const auto& env : arrayMember(detail, "environments")) {
        if (!env) continue;
        out << "=== Environment: " << stringMember(*env, "name") << " ===\n";
        for (const auto& step : arrayMember(*env, "deploySteps")) {
            if (!step) continue;
            for (const auto& phase : arrayMember(*step, "releaseDeployPhases")) {
                if (!phase) continue;
                for (const auto& job : arrayMember(*phase, "deploymentJobs")) {
                    if (!job) continue;
                    for (const auto& task : arrayMember(*job, "tasks")) {
                        if (!task) continue;
                        const std::string logUrl = stringMember(*task, "logUrl");
                        if (logUrl.empty()) {
                            continue;
                        }
                        const std::string taskName = stringMember(*task, "name");
                        try {
                            Reply log = pImpl->getChecked(logUrl, "text/plain");
                            out << "--- Task: " << taskName << " ---\n" << log.body << "\n";
                        } catch (const AzureDevOpsError& e) {
                            LOG_WARN("Skipping log of task '{}' in release {}: {}", taskName, releaseId, e.what());
                        }
                    }
                }
            }
        }
    }
    return out.str();
}

} // namespace adomcp::azuredevops
