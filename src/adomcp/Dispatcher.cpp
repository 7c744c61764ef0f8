//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/Dispatcher.cpp
// Purpose: JSON-RPC method dispatch and asynchronous response delivery
//==========================================================================================================

#include <chrono>
#include <system_error>
#include <utility>

#include "adomcp/Dispatcher.h"
#include "logging/Logger.h"

namespace adomcp {

Dispatcher::Dispatcher(const ToolRegistry& tools, SessionDirectory& sessions, Implementation serverInfo)
    : tools(tools), sessions(sessions), serverInfo(std::move(serverInfo)) {}

Dispatcher::~Dispatcher() {
    WaitForIdle();
}

std::unique_ptr<JSONRPCResponse> Dispatcher::Handle(const JSONRPCRequest& request) const {
    if (request.method.rfind(Methods::NotificationPrefix, 0) == 0) {
        if (request.method == Methods::Initialized) {
            LOG_INFO("Client initialized");
        } else {
            LOG_DEBUG("Ignoring notification: {}", request.method);
        }
        return nullptr;
    }
    if (!request.jsonrpc.empty() && request.jsonrpc != "2.0") {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidRequest,
                                   "Invalid Request: unsupported jsonrpc version '" + request.jsonrpc + "'");
    }
    if (request.method == Methods::Initialize) {
        return handleInitialize(request);
    }
    if (request.method == Methods::ListTools) {
        return handleToolsList(request);
    }
    if (request.method == Methods::CallTool) {
        return handleToolsCall(request);
    }
    LOG_DEBUG("Unknown method: {}", request.method);
    return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                               "Method not found: " + request.method);
}

std::unique_ptr<JSONRPCResponse> Dispatcher::handleInitialize(const JSONRPCRequest& request) const {
    LOG_INFO("Handling initialize request");
    JSONValue::Object resultObj;
    resultObj["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);

    JSONValue::Object capabilities;
    capabilities["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
    resultObj["capabilities"] = std::make_shared<JSONValue>(std::move(capabilities));

    JSONValue::Object serverInfoObj;
    serverInfoObj["name"] = std::make_shared<JSONValue>(serverInfo.name);
    serverInfoObj["version"] = std::make_shared<JSONValue>(serverInfo.version);
    resultObj["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfoObj));

    return std::make_unique<JSONRPCResponse>(request.id, JSONValue{std::move(resultObj)});
}

std::unique_ptr<JSONRPCResponse> Dispatcher::handleToolsList(const JSONRPCRequest& request) const {
    LOG_DEBUG("Handling tools/list request");
    JSONValue::Array arr;
    for (const auto& t : tools.List()) {
        arr.push_back(std::make_shared<JSONValue>(ToolToJSON(t)));
    }
    JSONValue::Object resultObj;
    resultObj["tools"] = std::make_shared<JSONValue>(std::move(arr));
    return std::make_unique<JSONRPCResponse>(request.id, JSONValue{std::move(resultObj)});
}

std::unique_ptr<JSONRPCResponse> Dispatcher::handleToolsCall(const JSONRPCRequest& request) const {
    LOG_DEBUG("Handling tools/call request");
    if (!request.params.has_value() || !request.params->IsObject()) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: params must be an object");
    }
    CallToolParams call;
    const JSONValue* name = request.params->Find("name");
    if (name == nullptr || !name->IsString() || std::get<std::string>(name->value).empty()) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
    }
    call.name = std::get<std::string>(name->value);
    const JSONValue* arguments = request.params->Find("arguments");
    if (arguments != nullptr) {
        if (!arguments->IsObject() && !arguments->IsNull()) {
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: arguments must be an object");
        }
        call.arguments = *arguments;
    } else {
        call.arguments = JSONValue{JSONValue::Object{}};
    }

    const ToolRegistry::Entry* entry = tools.Find(call.name);
    if (entry == nullptr) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Tool not found: " + call.name);
    }

    CallToolResult tr;
    const auto started = std::chrono::steady_clock::now();
    try {
        tr = entry->handler(call.arguments);
    } catch (const std::exception& e) {
        LOG_WARN("Tool {} failed: {}", call.name, e.what());
        tr = CallToolResult::Error(e.what());
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    LOG_DEBUG("Tool {} finished in {} ms (isError={})", call.name, elapsed.count(), tr.isError);
    return std::make_unique<JSONRPCResponse>(request.id, CallToolResultToJSON(tr));
}

void Dispatcher::process(const std::string& sessionId, const JSONRPCRequest& request) const {
    auto response = Handle(request);
    if (!response) {
        return;
    }
    if (!sessions.Deliver(sessionId, response->Serialize())) {
        LOG_DEBUG("Response id={} for {} not delivered to session {}", IdToString(request.id), request.method, sessionId);
    }
}

void Dispatcher::Dispatch(const std::string& sessionId, JSONRPCRequest request) {
    std::lock_guard<std::mutex> lock(tasksMutex);
    reapFinished();
    try {
        tasks.push_back(std::async(std::launch::async, [this, sessionId, req = std::move(request)]() {
            try {
                process(sessionId, req);
            } catch (const std::exception& e) {
                LOG_ERROR("Dispatch of {} for session {} failed: {}", req.method, sessionId, e.what());
            }
        }));
    } catch (const std::system_error& e) {
        LOG_ERROR("Could not start dispatch task for session {}: {}", sessionId, e.what());
    }
}

void Dispatcher::reapFinished() {
    for (auto it = tasks.begin(); it != tasks.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tasks.erase(it);
        } else {
            ++it;
        }
    }
}

void Dispatcher::WaitForIdle() {
    for (;;) {
        std::list<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(tasksMutex);
            pending.swap(tasks);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& f : pending) {
            f.wait();
        }
    }
}

std::size_t Dispatcher::InFlight() const {
    std::lock_guard<std::mutex> lock(tasksMutex);
    return tasks.size();
}

} // namespace adomcp
