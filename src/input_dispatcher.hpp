// =============================================================================
// Scry - Input Dispatcher
// =============================================================================
// Producers enqueue InputEvents from any thread without ever touching device
// I/O. A single worker drains the queue in FIFO order and writes each event's
// full frame sequence to the Control channel in one write.
// =============================================================================
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "input_encoder.hpp"
#include "input_event.hpp"
#include "result.hpp"
#include "transport.hpp"

namespace scry {

enum class InputState { Enqueued, Dispatched, Acknowledged, Failed };

inline const char* inputStateName(InputState s) {
    switch (s) {
        case InputState::Enqueued:     return "Enqueued";
        case InputState::Dispatched:   return "Dispatched";
        case InputState::Acknowledged: return "Acknowledged";
        case InputState::Failed:       return "Failed";
    }
    return "?";
}

struct InputOutcome {
    uint64_t ticket = 0;
    InputState state = InputState::Enqueued;
    std::optional<Error> error;   // set when state == Failed
};

/**
 * Thread model:
 *   enqueue()  any thread, never blocks on I/O, unbounded queue
 *   worker     one thread, owns the encoder and all channel writes
 *   callback   invoked for every state change; Enqueued on the producer
 *              thread, the rest on the worker (or the stop() caller)
 *
 * A failed write (DeviceBusy, Connection) is reported and the worker moves on
 * to the next event.
 */
class InputDispatcher {
public:
    using OutcomeCallback = std::function<void(const InputOutcome&)>;

    InputDispatcher(std::shared_ptr<Stream> control, int swipe_step_ms, OutcomeCallback callback = nullptr);
    ~InputDispatcher();

    InputDispatcher(const InputDispatcher&) = delete;
    InputDispatcher& operator=(const InputDispatcher&) = delete;

    void start();

    // Returns the event's ticket. After stop() the event is reported Failed
    // (Cancelled) straight away.
    uint64_t enqueue(InputEvent event);

    // Stops accepting and wakes the worker without waiting for it. The
    // in-flight write, if any, keeps running until its channel returns.
    void requestStop();

    // requestStop(), joins the worker, then reports everything still queued
    // as Failed (Cancelled). Idempotent.
    void stop();

    bool running() const { return running_.load(); }
    size_t pending() const;
    uint64_t acknowledged() const { return acknowledged_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    struct Pending {
        uint64_t ticket;
        InputEvent event;
    };

    void workerLoop();
    void report(uint64_t ticket, InputState state, std::optional<Error> error = std::nullopt);

    std::shared_ptr<Stream> control_;
    InputEncoder encoder_;
    OutcomeCallback callback_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Pending> queue_;
    bool accepting_ = true;
    uint64_t next_ticket_ = 1;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> acknowledged_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace scry
