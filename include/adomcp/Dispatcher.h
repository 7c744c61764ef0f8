//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: JSON-RPC method dispatch for the MCP protocol subset served over SSE
//==========================================================================================================

#pragma once

#include <cstddef>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>

#include "adomcp/JSONRPCTypes.h"
#include "adomcp/Protocol.h"
#include "adomcp/SessionDirectory.h"
#include "adomcp/ToolRegistry.h"

namespace adomcp {

//==========================================================================================================
// Dispatcher
// Purpose: Turns one JSON-RPC request into at most one response and routes it to the session stream.
// Methods:
//   initialize                 -> protocolVersion, capabilities {tools:{}}, serverInfo
//   tools/list                 -> { tools: [...] }
//   tools/call                 -> CallToolResult; handler failures become isError=true results
//   notifications/*            -> no response
//   anything else              -> -32601 "Method not found: <method>"
// Notes:
//   Requests are processed independently and concurrently; responses for one session may therefore
//   arrive in a different order than the requests were posted.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& tools, SessionDirectory& sessions,
               Implementation serverInfo = Implementation{SERVER_NAME, SERVER_VERSION});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    //==========================================================================================================
    // Runs the protocol state machine synchronously.
    // Args:
    //   request: Decoded JSON-RPC request.
    // Returns:
    //   The response to deliver, or nullptr when the message is a notification.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Handle(const JSONRPCRequest& request) const;

    //==========================================================================================================
    // Schedules Handle() on its own task and delivers the serialized response to sessionId.
    // Notes:
    //   Returns immediately. Delivery failures (session gone, queue full) and any exception escaping
    //   the task are logged and dropped; nothing propagates to the caller.
    //==========================================================================================================
    void Dispatch(const std::string& sessionId, JSONRPCRequest request);

    //==========================================================================================================
    // Blocks until every task scheduled so far has finished.
    //==========================================================================================================
    void WaitForIdle();

    // Number of scheduled tasks that have not been reaped yet (finished tasks may still be counted).
    std::size_t InFlight() const;

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request) const;
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& request) const;
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& request) const;
    void process(const std::string& sessionId, const JSONRPCRequest& request) const;
    void reapFinished();

    const ToolRegistry& tools;
    SessionDirectory& sessions;
    const Implementation serverInfo;

    mutable std::mutex tasksMutex;
    std::list<std::future<void>> tasks;
};

} // namespace adomcp
