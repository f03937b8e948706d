// =============================================================================
// Scry - Input Encoder
// =============================================================================
// Expands one InputEvent into its complete control-frame sequence.
//   Tap       -> DOWN, UP
//   LongPress -> DOWN, WAIT, UP
//   Swipe     -> DOWN, n x [WAIT, MOVE], UP     n = max(1, duration / step)
//   Scroll    -> SCROLL
//   KeyText   -> TEXT(typed)   Paste -> TEXT(paste)
//   Key       -> KEY
// =============================================================================
#pragma once

#include <cstdint>
#include <vector>
#include "input_event.hpp"

namespace scry {

class InputEncoder {
public:
    explicit InputEncoder(int swipe_step_ms = 30)
        : swipe_step_ms_(swipe_step_ms > 0 ? swipe_step_ms : 30) {}

    // All frames of the event, concatenated; written to the channel in one call
    std::vector<uint8_t> encode(const InputEvent& event);

    uint32_t next_seq() const { return seq_; }

private:
    void frame(std::vector<uint8_t>& out, uint8_t cmd, const std::vector<uint8_t>& payload);
    void point(std::vector<uint8_t>& out, uint8_t cmd, int32_t x, int32_t y);
    void wait(std::vector<uint8_t>& out, uint32_t ms);
    void text(std::vector<uint8_t>& out, uint8_t flags, const std::string& utf8);

    int swipe_step_ms_;
    uint32_t seq_ = 0;
};

} // namespace scry
