//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/SSEServer.cpp
// Purpose: SSE streaming transport and message receiver using Boost.Beast coroutines
//==========================================================================================================

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "adomcp/JSONRPCTypes.h"
#include "adomcp/SSEServer.hpp"
#include "adomcp/UrlUtil.h"

namespace adomcp {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr auto kRequestReadTimeout = std::chrono::seconds(30);

bool isQuietDisconnect(const boost::system::error_code& ec) {
    return ec == http::error::end_of_stream || ec == net::error::operation_aborted ||
           ec == net::error::connection_reset || ec == net::error::broken_pipe ||
           ec == net::error::eof || ec == beast::error::timeout;
}

} // namespace

std::string FormatSSEEvent(const std::string& event, const std::string& data) {
    std::string out = "event: " + event + "\n";
    std::size_t start = 0;
    for (;;) {
        std::size_t nl = data.find('\n', start);
        std::string line = data.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out += "data: " + line + "\n";
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    out += "\n";
    return out;
}

class SSEServer::Impl {
public:
    SSEServer::Options opts;
    SessionDirectory& sessions;
    Dispatcher& dispatcher;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> boundPort{0};

    // Streams opened by this server, by session id; removed on disconnect, force-closed by Stop()
    std::mutex liveMutex;
    std::unordered_map<std::string, std::weak_ptr<beast::tcp_stream>> liveStreams;

    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    // Declared last: coroutine frames still parked on it are destroyed first and may touch the members above
    net::io_context ioc;

    Impl(const SSEServer::Options& o, SessionDirectory& s, Dispatcher& d)
        : opts(o), sessions(s), dispatcher(d) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        acceptor.reset();
    }

    //======================================================================================================
    // Removes the session from the directory when the stream coroutine finishes or its frame is destroyed.
    //======================================================================================================
    struct SessionGuard {
        Impl* self;
        std::string id;
        ~SessionGuard() {
            self->sessions.Remove(id);
            std::lock_guard<std::mutex> lock(self->liveMutex);
            self->liveStreams.erase(id);
        }
    };

    void validatePort() const {
        if (opts.port.empty()) {
            throw std::invalid_argument("SSEServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5) {
            throw std::invalid_argument("SSEServer invalid port (non-numeric): " + opts.port);
        }
        if (std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("SSEServer invalid port (out of range): " + opts.port);
        }
    }

    void listen() {
        validatePort();
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    http::response<http::string_body> makeStatus(const http::request<http::string_body>& req,
                                                 http::status status, const std::string& text) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::server, SERVER_NAME);
        res.set(http::field::access_control_allow_origin, "*");
        if (!text.empty()) {
            res.set(http::field::content_type, "text/plain; charset=utf-8");
            res.body() = text + "\n";
        }
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        return res;
    }

    //======================================================================================================
    // Request Receiver: validates the session, decodes the body and hands it to the dispatcher.
    //======================================================================================================
    http::response<http::string_body> receiveMessage(const http::request<http::string_body>& req,
                                                     const std::string& query) {
        if (req.method() != http::verb::post) {
            auto res = makeStatus(req, http::status::method_not_allowed, "Method not allowed");
            res.set(http::field::allow, "POST");
            return res;
        }
        const std::string sessionId = GetQueryParameter(query, "sessionId");
        if (sessionId.empty()) {
            LOG_DEBUG("POST {} without sessionId", opts.messagePath);
            return makeStatus(req, http::status::bad_request, "Missing sessionId");
        }
        if (!sessions.Lookup(sessionId)) {
            LOG_DEBUG("POST for unknown session {}", sessionId);
            return makeStatus(req, http::status::not_found, "Session not found");
        }
        JSONRPCRequest rpc;
        if (!rpc.Deserialize(req.body())) {
            LOG_DEBUG("Undecodable JSON-RPC request body for session {}", sessionId);
            return makeStatus(req, http::status::bad_request, "Invalid JSON-RPC request");
        }
        LOG_DEBUG("Received {} (id={}) for session {}", rpc.method, IdToString(rpc.id), sessionId);
        dispatcher.Dispatch(sessionId, std::move(rpc));
        return makeStatus(req, http::status::accepted, "");
    }

    //======================================================================================================
    // Watches the read side of an event stream; any read completion with an error means the peer is gone.
    //======================================================================================================
    static net::awaitable<void> watchDisconnect(std::shared_ptr<beast::tcp_stream> stream,
                                                std::shared_ptr<Session> session,
                                                std::shared_ptr<net::steady_timer> signal) {
        std::array<char, 512> scratch{};
        boost::system::error_code ec;
        for (;;) {
            co_await stream->async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
        }
        session->Close();
        signal->cancel();
        co_return;
    }

    //======================================================================================================
    // Streaming Transport: one session per GET; runs until disconnect or shutdown.
    //======================================================================================================
    net::awaitable<void> serveEventStream(std::shared_ptr<beast::tcp_stream> stream,
                                          const http::request<http::string_body>& req) {
        auto session = sessions.Create();
        SessionGuard guard{this, session->Id()};
        {
            std::lock_guard<std::mutex> lock(liveMutex);
            liveStreams.emplace(session->Id(), stream);
        }
        LOG_INFO("New SSE session {}", session->Id());

        stream->expires_never();
        boost::system::error_code optEc;
        stream->socket().set_option(tcp::no_delay(true), optEc);

        http::response<http::empty_body> res{http::status::ok, req.version()};
        res.set(http::field::server, SERVER_NAME);
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(http::field::connection, "keep-alive");
        res.set(http::field::access_control_allow_origin, "*");
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(*stream, sr, net::use_awaitable);

        const std::string endpoint = FormatSSEEvent("endpoint", opts.messagePath + "?sessionId=" + session->Id());
        co_await net::async_write(*stream, net::buffer(endpoint), net::use_awaitable);

        auto executor = co_await net::this_coro::executor;
        auto signal = std::make_shared<net::steady_timer>(executor);
        session->SetWakeup([signal]() {
            net::post(signal->get_executor(), [signal]() { signal->cancel(); });
        });
        net::co_spawn(executor, watchDisconnect(stream, session, signal), net::detached);

        for (;;) {
            auto batch = session->Drain();
            if (!batch.empty()) {
                for (const auto& message : batch) {
                    const std::string event = FormatSSEEvent("message", message);
                    co_await net::async_write(*stream, net::buffer(event), net::use_awaitable);
                }
                // Re-drain before waiting: wake-ups posted during the writes found no pending wait
                continue;
            }
            if (session->IsClosed() || !running.load()) {
                break;
            }
            signal->expires_at(net::steady_timer::time_point::max());
            boost::system::error_code waitEc;
            co_await signal->async_wait(net::redirect_error(net::use_awaitable, waitEc));
        }
        LOG_INFO("SSE session {} closed", session->Id());

        boost::system::error_code ec;
        stream->socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return;
    }

    net::awaitable<void> connection(tcp::socket socket) {
        auto stream = std::make_shared<beast::tcp_stream>(std::move(socket));
        beast::flat_buffer buffer;
        try {
            for (;;) {
                http::request<http::string_body> req;
                stream->expires_after(kRequestReadTimeout);
                co_await http::async_read(*stream, buffer, req, net::use_awaitable);

                std::string path;
                std::string query;
                SplitTarget(std::string(req.target()), path, query);

                if (path == opts.ssePath) {
                    if (req.method() == http::verb::get) {
                        co_await serveEventStream(stream, req);
                        co_return;
                    }
                    auto res = makeStatus(req, http::status::method_not_allowed, "Method not allowed");
                    res.set(http::field::allow, "GET");
                    co_await http::async_write(*stream, res, net::use_awaitable);
                    if (!res.keep_alive()) break;
                    continue;
                }

                auto res = path == opts.messagePath ? receiveMessage(req, query)
                                                    : makeStatus(req, http::status::not_found, "Not found");
                co_await http::async_write(*stream, res, net::use_awaitable);
                if (!res.keep_alive()) {
                    break;
                }
            }
            boost::system::error_code ec;
            stream->socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            if (!running.load() || isQuietDisconnect(e.code())) {
                LOG_DEBUG("SSEServer connection ended: {}", e.what());
            } else {
                LOG_WARN("SSEServer connection error: {}", e.what());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("SSEServer connection error: {}", e.what());
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        while (running.load()) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (ec == net::error::operation_aborted || !running.load()) {
                    break;
                }
                LOG_WARN("SSEServer accept error: {}", ec.message());
                continue;
            }
            net::co_spawn(ioc, connection(std::move(socket)), net::detached);
        }
        LOG_DEBUG("SSEServer accept loop finished");
        co_return;
    }
};

SSEServer::SSEServer(const Options& opts, SessionDirectory& sessions, Dispatcher& dispatcher)
    : pImpl(std::make_unique<Impl>(opts, sessions, dispatcher)) {}

SSEServer::~SSEServer() {
    if (pImpl->running.load()) {
        Stop().wait();
    }
}

std::future<void> SSEServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load() || pImpl->ioThread.joinable()) {
        ready.set_exception(std::make_exception_ptr(std::logic_error("SSEServer already started")));
        return fut;
    }
    try {
        pImpl->listen();
    } catch (const std::exception& e) {
        LOG_ERROR("SSEServer failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    pImpl->ioc.restart();
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("SSEServer I/O thread terminated: {}", e.what());
        }
    });
    LOG_INFO("SSE server listening on {}:{} (stream {}, messages {})",
             pImpl->opts.address, pImpl->boundPort.load(), pImpl->opts.ssePath, pImpl->opts.messagePath);
    ready.set_value();
    return fut;
}

std::future<void> SSEServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    std::vector<std::string> ids;
    std::vector<std::weak_ptr<beast::tcp_stream>> streams;
    {
        std::lock_guard<std::mutex> lock(pImpl->liveMutex);
        for (const auto& [id, stream] : pImpl->liveStreams) {
            ids.push_back(id);
            streams.push_back(stream);
        }
    }
    for (const auto& id : ids) {
        pImpl->sessions.Remove(id);
    }
    if (pImpl->ioThread.joinable()) {
        // The acceptor and sockets belong to the I/O thread; close them there so clients see the stream end
        auto closed = std::make_shared<std::promise<void>>();
        auto closedFut = closed->get_future();
        Impl* impl = pImpl.get();
        net::post(pImpl->ioc, [impl, streams, closed]() {
            if (impl->acceptor) {
                boost::system::error_code ec;
                impl->acceptor->close(ec);
            }
            for (const auto& weak : streams) {
                if (auto stream = weak.lock()) {
                    boost::system::error_code ec;
                    stream->socket().shutdown(tcp::socket::shutdown_both, ec);
                    stream->socket().close(ec);
                }
            }
            closed->set_value();
        });
        if (closedFut.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            LOG_WARN("SSEServer timed out closing the listener and {} open stream(s)", streams.size());
        }
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    // No I/O thread is left to race with
    if (pImpl->acceptor && pImpl->acceptor->is_open()) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    LOG_INFO("SSE server stopped");
    done.set_value();
    return fut;
}

bool SSEServer::IsRunning() const {
    return pImpl->running.load();
}

std::uint16_t SSEServer::BoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace adomcp
