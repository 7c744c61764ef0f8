//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionDirectory.h
// Purpose: Session id -> outbound queue mapping shared by the SSE transport and the dispatcher
//==========================================================================================================

#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace adomcp {

// Default per-session queue capacity
constexpr std::size_t kDefaultQueueCapacity = 10;

//==========================================================================================================
// Session
// Purpose: One streaming connection's bounded outbound message queue.
// Notes:
//   - Many producers (dispatch tasks), one consumer (the stream serving this session).
//   - Overflow policy is drop-newest: Enqueue never blocks; a full queue rejects the new message
//     and logs a warning, so an unresponsive client cannot stall anything outside its own session.
//   - The wake-up hook runs on the producer thread while the queue lock is held; it must only
//     schedule work (e.g. post to an executor) and never block. Close() clears it, so no hook
//     invocation can start after Close() returns.
//==========================================================================================================
class Session {
public:
    enum class EnqueueResult {
        Queued,
        Dropped,  // queue full
        Closed    // session torn down
    };

    Session(std::string id, std::size_t capacity);

    const std::string& Id() const { return id; }
    std::size_t Capacity() const { return capacity; }

    //==========================================================================================================
    // Appends a serialized message for delivery.
    // Returns:
    //   Queued on success, Dropped when the queue is full, Closed when the session has been closed.
    //==========================================================================================================
    EnqueueResult Enqueue(std::string message);

    // Removes and returns every queued message in FIFO order.
    std::vector<std::string> Drain();

    std::size_t Pending() const;

    // Installs the consumer wake-up hook invoked after every successful Enqueue.
    void SetWakeup(std::function<void()> hook);

    // Marks the session closed, drops pending messages and clears the wake-up hook. Idempotent.
    void Close();
    bool IsClosed() const;

private:
    const std::string id;
    const std::size_t capacity;
    mutable std::mutex mutex;
    std::deque<std::string> queue;
    std::function<void()> wakeup;
    bool closed = false;
};

//==========================================================================================================
// SessionDirectory
// Purpose: Concurrency-safe registry of live sessions.
// Notes:
//   Identifiers are random UUID v4 strings so one client cannot guess another's session.
//   Instances are injected into the server and dispatcher; there is no process-global directory.
//==========================================================================================================
class SessionDirectory {
public:
    explicit SessionDirectory(std::size_t queueCapacity = kDefaultQueueCapacity);
    ~SessionDirectory();

    SessionDirectory(const SessionDirectory&) = delete;
    SessionDirectory& operator=(const SessionDirectory&) = delete;

    //==========================================================================================================
    // Creates and registers a new session with a fresh random identifier.
    //==========================================================================================================
    std::shared_ptr<Session> Create();

    //==========================================================================================================
    // Returns the session for id, or nullptr when it does not exist (never opened or already removed).
    //==========================================================================================================
    std::shared_ptr<Session> Lookup(const std::string& id) const;

    //==========================================================================================================
    // Closes and unregisters the session. Unknown ids are ignored.
    //==========================================================================================================
    void Remove(const std::string& id);

    //==========================================================================================================
    // Looks up the session and enqueues message on it.
    // Returns:
    //   true when queued; false when the session is gone, closed, or its queue is full (message dropped).
    //==========================================================================================================
    bool Deliver(const std::string& id, std::string message);

    // Closes and unregisters every session (server shutdown).
    void CloseAll();

    std::size_t Size() const;
    std::size_t QueueCapacity() const { return queueCapacity; }

private:
    std::string newSessionId();

    const std::size_t queueCapacity;
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    std::mutex generatorMutex;
    struct Generator;
    std::unique_ptr<Generator> generator;
};

} // namespace adomcp
