//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSEServer.hpp
// Purpose: Coroutine-based HTTP server exposing the MCP SSE transport using Boost.Beast
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <future>
#include <memory>

#include "adomcp/Dispatcher.h"
#include "adomcp/SessionDirectory.h"

namespace adomcp {

//==========================================================================================================
// Frames one server-sent event: "event: <event>\n" followed by one "data: " line per line of data and a
// terminating blank line.
//==========================================================================================================
std::string FormatSSEEvent(const std::string& event, const std::string& data);

//==========================================================================================================
// SSEServer
// Purpose: Serves two paths on one listener.
//   GET  ssePath                       -> text/event-stream; first event "endpoint" carrying
//                                         "<messagePath>?sessionId=<id>", then one "message" event
//                                         per queued JSON-RPC response until the client disconnects.
//   POST messagePath?sessionId=<id>    -> 202 Accepted (empty body); the request is handed to the
//                                         Dispatcher. 400 missing id or bad body, 404 unknown id,
//                                         405 wrong method.
// Notes:
//   All sockets are driven by one I/O thread; tool execution happens on dispatcher tasks.
//==========================================================================================================
class SSEServer {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8080); "0" picks an ephemeral port (see BoundPort())
    //   ssePath: Streaming path
    //   messagePath: Message-submission path
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8080"};
        std::string ssePath{"/sse"};
        std::string messagePath{"/message"};
    };

    SSEServer(const Options& opts, SessionDirectory& sessions, Dispatcher& dispatcher);
    ~SSEServer();

    SSEServer(const SSEServer&) = delete;
    SSEServer& operator=(const SSEServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once accepting; it holds an exception when the port is invalid or
    //   the address cannot be resolved or bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor and all sessions, stops the I/O context, joins the thread.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;

    // Port actually bound (useful with port "0"); 0 before Start().
    std::uint16_t BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace adomcp
