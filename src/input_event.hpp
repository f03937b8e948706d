// =============================================================================
// Scry - Input Events
// =============================================================================
// UI-level input in device pixel coordinates. Events are values: once handed
// to the dispatcher they are never modified.
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace scry {

struct Tap {
    int32_t x = 0;
    int32_t y = 0;
};

struct LongPress {
    int32_t x = 0;
    int32_t y = 0;
    uint32_t duration_ms = 500;
};

struct Swipe {
    int32_t x0 = 0, y0 = 0;
    int32_t x1 = 0, y1 = 0;
    uint32_t duration_ms = 300;
};

// Scroll by (dx, dy) with the gesture centred on (x, y).
// Positive dy scrolls content down (finger moves up).
struct Scroll {
    int32_t x = 0;
    int32_t y = 0;
    int32_t dx = 0;
    int32_t dy = 0;
};

struct KeyText {
    std::string utf8;
};

struct Key {
    int32_t code = 0;
};

struct Paste {
    std::string utf8;
};

using InputEvent = std::variant<Tap, LongPress, Swipe, Scroll, KeyText, Key, Paste>;

// Android key codes used by the UI bindings
namespace keycode {
static constexpr int32_t HOME = 3;
static constexpr int32_t BACK = 4;
static constexpr int32_t ENTER = 66;
static constexpr int32_t DEL = 67;
static constexpr int32_t APP_SWITCH = 187;
} // namespace keycode

// Pointer gesture thresholds
static constexpr int32_t TAP_SLOP_PX = 20;
static constexpr uint32_t DRAG_SWIPE_MS = 300;
static constexpr int32_t WHEEL_STEP_PX = 300;

/**
 * Classifies a press/release pair from the pointer: releases within
 * TAP_SLOP_PX of the press are taps, anything further is a swipe.
 */
inline InputEvent gestureFromDrag(int32_t x0, int32_t y0, int32_t x1, int32_t y1) {
    int64_t ddx = static_cast<int64_t>(x1) - x0;
    int64_t ddy = static_cast<int64_t>(y1) - y0;
    if (ddx * ddx + ddy * ddy < static_cast<int64_t>(TAP_SLOP_PX) * TAP_SLOP_PX) {
        return Tap{x0, y0};
    }
    return Swipe{x0, y0, x1, y1, DRAG_SWIPE_MS};
}

// One wheel notch at (x, y); notches > 0 scrolls down
inline InputEvent scrollFromWheel(int32_t x, int32_t y, int notches) {
    return Scroll{x, y, 0, notches * WHEEL_STEP_PX};
}

inline const char* inputEventName(const InputEvent& ev) {
    static const char* const NAMES[] = {"Tap", "LongPress", "Swipe", "Scroll", "KeyText", "Key", "Paste"};
    return NAMES[ev.index()];
}

} // namespace scry
