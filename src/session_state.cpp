// =============================================================================
// Scry - Session State Machine Implementation
// =============================================================================
#include "session_state.hpp"
#include "scry_log.hpp"

namespace scry {

namespace {

using State = SessionStateMachine::State;
using Trigger = SessionStateMachine::Trigger;

struct Transition {
    State from;
    Trigger trigger;
    State to;
};

constexpr Transition TRANSITIONS[] = {
    {State::Idle,              Trigger::Start,          State::Enumerating},
    {State::Stopped,           Trigger::Start,          State::Enumerating},
    {State::Failed,            Trigger::Start,          State::Enumerating},

    {State::Enumerating,       Trigger::OneDevice,      State::Connecting},
    {State::Enumerating,       Trigger::SeveralDevices, State::AwaitingSelection},
    {State::Enumerating,       Trigger::NoDevices,      State::Failed},
    {State::AwaitingSelection, Trigger::Select,         State::Connecting},

    {State::Connecting,        Trigger::Connected,      State::Streaming},
    {State::Connecting,        Trigger::Fatal,          State::Failed},
    {State::Streaming,         Trigger::Fatal,          State::Failed},
    {State::Failed,            Trigger::Reconnect,      State::Connecting},

    {State::Idle,              Trigger::Stop,           State::Stopped},
    {State::Enumerating,       Trigger::Stop,           State::Stopped},
    {State::AwaitingSelection, Trigger::Stop,           State::Stopped},
    {State::Connecting,        Trigger::Stop,           State::Stopped},
    {State::Streaming,         Trigger::Stop,           State::Stopped},
};

} // namespace

bool SessionStateMachine::lookup(State from, Trigger trigger, State& to) {
    for (const auto& t : TRANSITIONS) {
        if (t.from == from && t.trigger == trigger) {
            to = t.to;
            return true;
        }
    }
    return false;
}

bool SessionStateMachine::canFire(Trigger trigger) const {
    State to;
    if (!lookup(state_, trigger, to)) return false;
    if (trigger == Trigger::Reconnect && reconnect_attempts_ >= max_reconnect_attempts_) return false;
    return true;
}

bool SessionStateMachine::fire(Trigger trigger) {
    State to;
    if (!lookup(state_, trigger, to)) {
        SLOG_DEBUG("session", "Ignored %s in %s", triggerName(trigger), stateName(state_));
        return false;
    }
    if (trigger == Trigger::Reconnect) {
        if (reconnect_attempts_ >= max_reconnect_attempts_) {
            SLOG_INFO("session", "Reconnect budget exhausted (%d)", max_reconnect_attempts_);
            return false;
        }
        reconnect_attempts_++;
    }
    if (trigger == Trigger::Start) reconnect_attempts_ = 0;

    SLOG_DEBUG("session", "%s --%s--> %s", stateName(state_), triggerName(trigger), stateName(to));
    state_ = to;
    return true;
}

const char* SessionStateMachine::stateName(State s) {
    switch (s) {
        case State::Idle:              return "Idle";
        case State::Enumerating:       return "Enumerating";
        case State::AwaitingSelection: return "AwaitingSelection";
        case State::Connecting:        return "Connecting";
        case State::Streaming:         return "Streaming";
        case State::Stopped:           return "Stopped";
        case State::Failed:            return "Failed";
    }
    return "?";
}

const char* SessionStateMachine::triggerName(Trigger t) {
    switch (t) {
        case Trigger::Start:          return "Start";
        case Trigger::OneDevice:      return "OneDevice";
        case Trigger::SeveralDevices: return "SeveralDevices";
        case Trigger::NoDevices:      return "NoDevices";
        case Trigger::Select:         return "Select";
        case Trigger::Connected:      return "Connected";
        case Trigger::Fatal:          return "Fatal";
        case Trigger::Reconnect:      return "Reconnect";
        case Trigger::Stop:           return "Stop";
    }
    return "?";
}

} // namespace scry
