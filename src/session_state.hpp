// =============================================================================
// Scry - Session State Machine
// =============================================================================
#pragma once

#include <cstdint>
#include <string>

namespace scry {

/**
 * Session lifecycle, free of I/O so every transition is testable.
 *
 *   Idle -> Enumerating -> (AwaitingSelection ->) Connecting -> Streaming
 *   Connecting | Streaming -> Failed -> Connecting   (budgeted Reconnect)
 *   any active state -> Stopped
 *
 * Stopped and Failed are terminal until the next Start. Start resets the
 * reconnect budget; each Reconnect out of Failed consumes one attempt.
 */
class SessionStateMachine {
public:
    enum class State {
        Idle,
        Enumerating,
        AwaitingSelection,
        Connecting,
        Streaming,
        Stopped,
        Failed
    };

    enum class Trigger {
        Start,
        OneDevice,
        SeveralDevices,
        NoDevices,
        Select,
        Connected,
        Fatal,
        Reconnect,
        Stop
    };

    explicit SessionStateMachine(int max_reconnect_attempts = 1)
        : max_reconnect_attempts_(max_reconnect_attempts < 0 ? 0 : max_reconnect_attempts) {}

    // Applies trigger if the table allows it from the current state.
    // Returns false (state unchanged) otherwise, or when Reconnect is out of budget.
    bool fire(Trigger trigger);

    bool canFire(Trigger trigger) const;

    State state() const { return state_; }
    int reconnectAttempts() const { return reconnect_attempts_; }
    int reconnectsLeft() const { return max_reconnect_attempts_ - reconnect_attempts_; }

    // Target state of (from, trigger), or false if not in the table
    static bool lookup(State from, Trigger trigger, State& to);

    static const char* stateName(State s);
    static const char* triggerName(Trigger t);

private:
    State state_ = State::Idle;
    int max_reconnect_attempts_;
    int reconnect_attempts_ = 0;
};

using SessionState = SessionStateMachine::State;
using SessionTrigger = SessionStateMachine::Trigger;

enum class FailureKind { None, CaptureDenied, ConnectionLost, DecodeFailed };

inline const char* failureKindName(FailureKind f) {
    switch (f) {
        case FailureKind::None:           return "None";
        case FailureKind::CaptureDenied:  return "CaptureDenied";
        case FailureKind::ConnectionLost: return "ConnectionLost";
        case FailureKind::DecodeFailed:   return "DecodeFailed";
    }
    return "?";
}

} // namespace scry
