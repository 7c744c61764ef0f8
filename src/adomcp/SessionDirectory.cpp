//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/SessionDirectory.cpp
// Purpose: Session registry and bounded per-session outbound queues
//==========================================================================================================

#include <stdexcept>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "adomcp/SessionDirectory.h"
#include "logging/Logger.h"

namespace adomcp {

//----------------------------------------------------------------------------------------------------------
// Session
//----------------------------------------------------------------------------------------------------------
Session::Session(std::string id, std::size_t capacity)
    : id(std::move(id)), capacity(capacity) {}

Session::EnqueueResult Session::Enqueue(std::string message) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        return EnqueueResult::Closed;
    }
    if (queue.size() >= capacity) {
        LOG_WARN("Session {} outbound queue full ({} messages); dropping newest message", id, capacity);
        return EnqueueResult::Dropped;
    }
    queue.push_back(std::move(message));
    if (wakeup) {
        wakeup();
    }
    return EnqueueResult::Queued;
}

std::vector<std::string> Session::Drain() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> out;
    out.reserve(queue.size());
    for (auto& m : queue) out.push_back(std::move(m));
    queue.clear();
    return out;
}

std::size_t Session::Pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

void Session::SetWakeup(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex);
    wakeup = std::move(hook);
}

void Session::Close() {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
    queue.clear();
    wakeup = nullptr;
}

bool Session::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

//----------------------------------------------------------------------------------------------------------
// SessionDirectory
//----------------------------------------------------------------------------------------------------------
struct SessionDirectory::Generator {
    boost::uuids::random_generator gen;
};

SessionDirectory::SessionDirectory(std::size_t queueCapacity)
    : queueCapacity(queueCapacity), generator(std::make_unique<Generator>()) {
    if (queueCapacity == 0) {
        throw std::invalid_argument("session queue capacity must be at least 1");
    }
}

SessionDirectory::~SessionDirectory() {
    CloseAll();
}

std::string SessionDirectory::newSessionId() {
    // random_generator is not thread-safe
    std::lock_guard<std::mutex> lock(generatorMutex);
    return boost::uuids::to_string(generator->gen());
}

std::shared_ptr<Session> SessionDirectory::Create() {
    for (;;) {
        auto session = std::make_shared<Session>(newSessionId(), queueCapacity);
        std::unique_lock<std::shared_mutex> lock(mutex);
        if (sessions.emplace(session->Id(), session).second) {
            LOG_DEBUG("Session registered: {} (active={})", session->Id(), sessions.size());
            return session;
        }
        // A v4 UUID collision is practically impossible; retry rather than replace a live session.
    }
}

std::shared_ptr<Session> SessionDirectory::Lookup(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = sessions.find(id);
    return it == sessions.end() ? nullptr : it->second;
}

void SessionDirectory::Remove(const std::string& id) {
    std::shared_ptr<Session> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return;
        }
        removed = std::move(it->second);
        sessions.erase(it);
    }
    removed->Close();
    LOG_DEBUG("Session removed: {}", id);
}

bool SessionDirectory::Deliver(const std::string& id, std::string message) {
    auto session = Lookup(id);
    if (!session) {
        LOG_DEBUG("Dropping message for unknown session {}", id);
        return false;
    }
    switch (session->Enqueue(std::move(message))) {
        case Session::EnqueueResult::Queued:
            return true;
        case Session::EnqueueResult::Closed:
            LOG_DEBUG("Dropping message for closed session {}", id);
            return false;
        case Session::EnqueueResult::Dropped:
            return false;
    }
    return false;
}

void SessionDirectory::CloseAll() {
    std::unordered_map<std::string, std::shared_ptr<Session>> closing;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        closing.swap(sessions);
    }
    for (auto& [id, session] : closing) {
        session->Close();
    }
}

std::size_t SessionDirectory::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return sessions.size();
}

} // namespace adomcp
