// =============================================================================
// Scry - Input Dispatcher Implementation
// =============================================================================
#include "input_dispatcher.hpp"
#include "event_bus.hpp"
#include "scry_log.hpp"

#include <chrono>

namespace scry {

InputDispatcher::InputDispatcher(std::shared_ptr<Stream> control, int swipe_step_ms,
                                 OutcomeCallback callback)
    : control_(std::move(control)), encoder_(swipe_step_ms), callback_(std::move(callback)) {}

InputDispatcher::~InputDispatcher() {
    stop();
}

void InputDispatcher::start() {
    std::lock_guard<std::mutex> lk(queue_mutex_);
    if (running_.load() || !accepting_) return;
    running_.store(true);
    worker_ = std::thread(&InputDispatcher::workerLoop, this);
    SLOG_INFO("input", "Input dispatcher started");
}

uint64_t InputDispatcher::enqueue(InputEvent event) {
    uint64_t ticket;
    bool accepted;
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        ticket = next_ticket_++;
        accepted = accepting_;
    }

    if (!accepted) {
        report(ticket, InputState::Failed, Error(ErrorKind::Cancelled, "input dispatcher stopped"));
        return ticket;
    }

    // Enqueued is reported before the worker can see the event
    report(ticket, InputState::Enqueued);
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        if (accepting_) {
            queue_.push_back({ticket, std::move(event)});
        } else {
            cancelled = true;
        }
    }
    if (cancelled) {
        report(ticket, InputState::Failed, Error(ErrorKind::Cancelled, "input dispatcher stopped"));
    } else {
        queue_cv_.notify_one();
    }
    return ticket;
}

void InputDispatcher::requestStop() {
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        accepting_ = false;
    }
    queue_cv_.notify_all();
}

void InputDispatcher::stop() {
    requestStop();
    if (worker_.joinable()) worker_.join();

    std::deque<Pending> leftover;
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        leftover.swap(queue_);
    }
    if (running_.exchange(false)) {
        SLOG_INFO("input", "Input dispatcher stopped (%llu ok, %llu failed, %zu cancelled)",
                  (unsigned long long)acknowledged_.load(), (unsigned long long)failed_.load(),
                  leftover.size());
    }

    for (const auto& p : leftover) {
        report(p.ticket, InputState::Failed, Error(ErrorKind::Cancelled, "input dispatcher stopped"));
    }
}

size_t InputDispatcher::pending() const {
    std::lock_guard<std::mutex> lk(queue_mutex_);
    return queue_.size();
}

void InputDispatcher::report(uint64_t ticket, InputState state, std::optional<Error> error) {
    if (state == InputState::Acknowledged) acknowledged_++;
    if (state == InputState::Failed) failed_++;

    InputOutcome outcome;
    outcome.ticket = ticket;
    outcome.state = state;
    outcome.error = error;
    if (callback_) callback_(outcome);

    if (state == InputState::Acknowledged || state == InputState::Failed) {
        InputOutcomeEvent evt;
        evt.ticket = ticket;
        evt.ok = state == InputState::Acknowledged;
        if (error) {
            evt.error_kind = static_cast<int>(error->kind);
            evt.message = error->message;
        }
        bus().publish(evt);
    }
}

void InputDispatcher::workerLoop() {
    while (true) {
        std::unique_lock<std::mutex> lk(queue_mutex_);
        queue_cv_.wait(lk, [this] {
            return !queue_.empty() || !accepting_;
        });
        if (!accepting_) break;
        Pending task = std::move(queue_.front());
        queue_.pop_front();
        lk.unlock();

        std::vector<uint8_t> bytes = encoder_.encode(task.event);
        report(task.ticket, InputState::Dispatched);

        auto t0 = std::chrono::steady_clock::now();
        auto result = control_->write(bytes.data(), bytes.size());
        int ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        if (result.is_ok()) {
            SLOG_DEBUG("input", "#%llu %s OK (%dms)", (unsigned long long)task.ticket,
                       inputEventName(task.event), ms);
            report(task.ticket, InputState::Acknowledged);
        } else {
            const Error& err = result.error();
            SLOG_ERROR("input", "#%llu %s failed (%s, %dms): %s", (unsigned long long)task.ticket,
                       inputEventName(task.event), errorKindName(err.kind), ms, err.message.c_str());
            report(task.ticket, InputState::Failed, err);
        }
    }
}

} // namespace scry
