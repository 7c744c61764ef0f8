//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_azuredevops_client.cpp
// Purpose: GoogleTests for the Azure DevOps REST client against a loopback stub backend
//==========================================================================================================

#include <gtest/gtest.h>

#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "adomcp/azuredevops/Client.hpp"

using namespace adomcp;
using namespace adomcp::azuredevops;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// StubBackend
// Purpose: Loopback HTTP server answering canned responses by request target and recording what it saw.
//==========================================================================================================
class StubBackend {
public:
    struct Route {
        unsigned int status{200};
        std::string body;
        std::string contentType{"application/json"};
    };

    struct Seen {
        std::string target;
        std::string authorization;
        std::string accept;
        std::string userAgent;
    };

    StubBackend() : acceptor(ioc) {
        tcp::endpoint ep(net::ip::make_address("127.0.0.1"), 0);
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        net::co_spawn(ioc, acceptLoop(), net::detached);
        thread = std::thread([this]() { ioc.run(); });
    }

    ~StubBackend() { Stop(); }

    void Stop() {
        if (!thread.joinable()) {
            return;
        }
        ioc.stop();
        thread.join();
        boost::system::error_code ec;
        acceptor.close(ec);
    }

    void On(const std::string& target, Route route) {
        std::lock_guard<std::mutex> lock(mutex);
        routes[target] = std::move(route);
    }

    std::vector<Seen> Requests() {
        std::lock_guard<std::mutex> lock(mutex);
        return seen;
    }

    std::string BaseUrl() const { return "http://127.0.0.1:" + std::to_string(port); }
    unsigned short Port() const { return port; }

private:
    net::awaitable<void> acceptLoop() {
        for (;;) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor.async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                co_return;
            }
            net::co_spawn(ioc, serve(std::move(socket)), net::detached);
        }
    }

    net::awaitable<void> serve(tcp::socket socket) {
        beast::tcp_stream stream(std::move(socket));
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        boost::system::error_code ec;
        co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return;
        }

        Route route{404, "route not stubbed", "text/plain"};
        {
            std::lock_guard<std::mutex> lock(mutex);
            const std::string target(req.target());
            seen.push_back(Seen{target, std::string(req[http::field::authorization]),
                                std::string(req[http::field::accept]), std::string(req[http::field::user_agent])});
            auto it = routes.find(target);
            if (it != routes.end()) {
                route = it->second;
            }
        }

        http::response<http::string_body> res{static_cast<http::status>(route.status), req.version()};
        res.set(http::field::content_type, route.contentType);
        res.body() = route.body;
        res.keep_alive(false);
        res.prepare_payload();
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    net::io_context ioc;
    tcp::acceptor acceptor;
    unsigned short port{0};
    std::thread thread;
    std::mutex mutex;
    std::map<std::string, Route> routes;
    std::vector<Seen> seen;
};

AzureDevOpsClient::Options optionsFor(const std::string& baseUrl, const std::string& project = "Web") {
    AzureDevOpsClient::Options o;
    o.baseUrl = baseUrl;
    o.project = project;
    o.token = "pat";
    o.connectTimeoutMs = 2000;
    o.readTimeoutMs = 5000;
    return o;
}

} // namespace

TEST(AzureDevOpsClient, ComposesResourceUrls) {
    AzureDevOpsClient withProject(optionsFor("https://tfs.local/tfs/DefaultCollection/"));
    EXPECT_EQ(withProject.ResourceUrl("", "build/builds?api-version=6.0"),
              "https://tfs.local/tfs/DefaultCollection/Web/_apis/build/builds?api-version=6.0");
    EXPECT_EQ(withProject.ResourceUrl("My Project", "release/releases/3"),
              "https://tfs.local/tfs/DefaultCollection/My%20Project/_apis/release/releases/3");

    AzureDevOpsClient noProject(optionsFor("https://dev.azure.com/org", ""));
    EXPECT_EQ(noProject.ResourceUrl("", "build/builds"), "https://dev.azure.com/org/_apis/build/builds");
}

TEST(AzureDevOpsClient, RejectsEmptyBaseUrl) {
    EXPECT_THROW(AzureDevOpsClient{optionsFor("///")}, AzureDevOpsError);
}

//==========================================================================================================
// Requests carry basic auth built from the token and decode the build list.
//==========================================================================================================
TEST(AzureDevOpsClient, GetBuildsSendsAuthAndDecodesList) {
    StubBackend backend;
    backend.On("/Collection/Web/_apis/build/builds?api-version=6.0&$top=5",
               {200, R"({"count":2,"value":[
                   {"id":11,"buildNumber":"20250101.1","status":"completed","result":"succeeded",
                    "definition":{"name":"CI"},"url":"https://x/11"},
                   {"id":12,"buildNumber":"20250101.2","status":"inProgress","definition":{"name":"CI"}}]})"});

    AzureDevOpsClient client(optionsFor(backend.BaseUrl() + "/Collection"));
    auto builds = client.GetBuilds("", 5);
    ASSERT_EQ(builds.size(), 2u);
    EXPECT_EQ(builds[0].id, 11);
    EXPECT_EQ(builds[0].buildNumber, "20250101.1");
    EXPECT_EQ(builds[0].result, "succeeded");
    EXPECT_EQ(builds[0].definitionName, "CI");
    EXPECT_EQ(builds[1].status, "inProgress");
    EXPECT_TRUE(builds[1].result.empty());

    auto seen = backend.Requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].authorization, "Basic OnBhdA==");
    EXPECT_EQ(seen[0].accept, "application/json");
    EXPECT_EQ(seen[0].userAgent, "adomcp/1.0.0");
}

TEST(AzureDevOpsClient, ExplicitProjectOverridesDefault) {
    StubBackend backend;
    backend.On("/c/Mobile%20App/_apis/release/releases/7?api-version=6.0",
               {200, R"({"id":7,"name":"Release-7","status":"active","createdOn":"2025-01-01T00:00:00Z",
                         "releaseDefinition":{"name":"Ship"}})"});

    AzureDevOpsClient client(optionsFor(backend.BaseUrl() + "/c"));
    Release r = client.GetRelease("Mobile App", 7);
    EXPECT_EQ(r.id, 7);
    EXPECT_EQ(r.name, "Release-7");
    EXPECT_EQ(r.releaseDefinitionName, "Ship");
}

TEST(AzureDevOpsClient, NonSuccessStatusThrowsWithStatusAndBody) {
    StubBackend backend;
    backend.On("/c/Web/_apis/build/builds/9?api-version=6.0", {401, "unauthorized", "text/plain"});

    AzureDevOpsClient client(optionsFor(backend.BaseUrl() + "/c"));
    try {
        client.GetBuild("", 9);
        FAIL() << "expected AzureDevOpsError";
    } catch (const AzureDevOpsError& e) {
        EXPECT_STREQ(e.what(), "API request failed with status 401: unauthorized");
        EXPECT_EQ(e.status, 401u);
    }
}

TEST(AzureDevOpsClient, MalformedPayloadThrows) {
    StubBackend backend;
    backend.On("/c/Web/_apis/release/releases?api-version=6.0&$top=10", {200, "<html>sign in</html>", "text/html"});
    AzureDevOpsClient client(optionsFor(backend.BaseUrl() + "/c"));
    EXPECT_THROW(client.GetReleases("", 10), AzureDevOpsError);
}

//==========================================================================================================
// Build logs are concatenated in listing order; a log that fails to download is skipped.
//==========================================================================================================
TEST(AzureDevOpsClient, BuildLogsAreConcatenatedSkippingFailures) {
    StubBackend backend;
    backend.On("/c/Web/_apis/build/builds/5/logs?api-version=6.0",
               {200, R"({"count":3,"value":[{"id":1},{"id":2},{"id":3}]})"});
    backend.On("/c/Web/_apis/build/builds/5/logs/1?api-version=6.0", {200, "alpha", "text/plain"});
    backend.On("/c/Web/_apis/build/builds/5/logs/2?api-version=6.0", {500, "boom", "text/plain"});
    backend.On("/c/Web/_apis/build/builds/5/logs/3?api-version=6.0", {200, "gamma", "text/plain"});

    AzureDevOpsClient client(optionsFor(backend.BaseUrl() + "/c"));
    EXPECT_EQ(client.GetBuildLogs("", 5), "--- Log ID 1 ---\nalpha\n--- Log ID 3 ---\ngamma\n");

    auto seen = backend.Requests();
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[1].accept, "text/plain");
}

TEST(AzureDevOpsClient, BuildLogListingFailureThrows) {
    StubBackend backend;
    AzureDevOpsClient client(optionsFor(backend.BaseUrl() + "/c"));
    EXPECT_THROW(client.GetBuildLogs("", 404), AzureDevOpsError);
}

//==========================================================================================================
// Release logs follow environments, deploy steps, phases, jobs and tasks; tasks without logUrl are skipped.
//==========================================================================================================
TEST(AzureDevOpsClient, ReleaseLogsWalkTheDeploymentTree) {
    StubBackend backend;
    const std::string base = backend.BaseUrl();
    backend.On("/c/Web/_apis/release/releases/3?api-version=6.0",
               {200, R"({"id":3,"environments":[
                   {"name":"QA","deploySteps":[{"releaseDeployPhases":[{"deploymentJobs":[{"tasks":[
                       {"name":"Initialize"},
                       {"name":"Deploy","logUrl":")" + base + R"(/logs/deploy"}]}]}]}]},
                   {"name":"Prod","deploySteps":[{"releaseDeployPhases":[{"deploymentJobs":[{"tasks":[
                       {"name":"Gate","logUrl":")" + base + R"(/logs/gate"},
                       {"name":"Swap","logUrl":")" + base + R"(/logs/swap"}]}]}]}]}]})"});
    backend.On("/logs/deploy", {200, "deploy ok", "text/plain"});
    backend.On("/logs/gate", {403, "forbidden", "text/plain"});
    backend.On("/logs/swap", {200, "swap ok", "text/plain"});

    AzureDevOpsClient client(optionsFor(base + "/c"));
    EXPECT_EQ(client.GetReleaseLogs("", 3),
              "=== Environment: QA ===\n--- Task: Deploy ---\ndeploy ok\n"
              "=== Environment: Prod ===\n--- Task: Swap ---\nswap ok\n");
}

TEST(AzureDevOpsClient, UnreachableBackendThrows) {
    std::string base;
    {
        StubBackend backend;
        base = backend.BaseUrl();
    }
    AzureDevOpsClient client(optionsFor(base + "/c"));
    EXPECT_THROW(client.GetBuilds("", 1), AzureDevOpsError);
}
