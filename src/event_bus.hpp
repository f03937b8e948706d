// =============================================================================
// Scry - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Decouples the session core from the UI that reports its progress.
// Usage:
//   auto sub = scry::bus().subscribe<SessionStateEvent>([](const auto& e) { ... });
//   scry::bus().publish(SessionStateEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <cstdint>
#include <utility>
#include <algorithm>
#include "scry_log.hpp"

namespace scry {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Session lifecycle (SessionManager -> UI)
struct SessionStateEvent : Event {
    std::string device_id;
    int state = 0;          // maps to SessionState enum
    int failure = 0;        // maps to FailureKind enum (None when not failed)
    std::string message;
};

// Candidate list when more than one device is attached
struct DevicesDiscoveredEvent : Event {
    std::vector<std::string> device_ids;
};

// Per-event input outcome (InputDispatcher -> UI)
struct InputOutcomeEvent : Event {
    uint64_t ticket = 0;
    bool ok = false;
    int error_kind = 0;     // maps to ErrorKind enum when !ok
    std::string message;
};

// File push completion (FilePusher -> UI)
struct TransferFinishedEvent : Event {
    std::string local_path;
    std::string remote_path;
    bool ok = false;
    int reason = 0;         // maps to TransferError::Reason when !ok
    std::string message;
};

// =============================================================================
// SubscriptionHandle - unsubscribes when destroyed
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { reset(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (this != &o) {
            reset();
            unsub_ = std::move(o.unsub_);
            o.unsub_ = nullptr;
        }
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void reset() {
        if (unsub_) {
            unsub_();
            unsub_ = nullptr;
        }
    }

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================
// Handlers run on the publishing thread, outside the bus lock, so a handler
// may subscribe or publish without deadlocking.

class EventBus {
public:
    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        auto fn = std::make_shared<Handler>([handler = std::move(handler)](const Event& e) {
            handler(static_cast<const T&>(e));
        });
        const std::type_index key(typeid(T));
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            handlers_[key].emplace_back(id, fn);
        }

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it == handlers_.end()) return;
            auto& list = it->second;
            list.erase(std::remove_if(list.begin(), list.end(),
                [id](const Entry& e) { return e.first == id; }), list.end());
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<std::shared_ptr<Handler>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it == handlers_.end()) return;
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) targets.push_back(entry.second);
        }

        for (const auto& fn : targets) {
            try {
                (*fn)(event);
            } catch (const std::exception& e) {
                SLOG_ERROR("eventbus", "Handler for %s threw: %s", typeid(T).name(), e.what());
            }
        }
    }

private:
    using Handler = std::function<void(const Event&)>;
    using Entry = std::pair<uint64_t, std::shared_ptr<Handler>>;

    std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    uint64_t next_id_ = 1;
};

// Process-wide bus
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace scry
