// =============================================================================
// Scry - Input Encoder Implementation
// =============================================================================
#include "input_encoder.hpp"
#include "scry_protocol.hpp"

#include <algorithm>

namespace scry {

using namespace protocol;

namespace {

// Largest prefix of s[from..] that fits max_bytes without splitting a UTF-8 sequence
size_t utf8Prefix(const std::string& s, size_t from, size_t max_bytes) {
    size_t n = std::min(max_bytes, s.size() - from);
    if (from + n == s.size()) return n;
    while (n > 0 && (static_cast<unsigned char>(s[from + n]) & 0xC0) == 0x80) n--;
    return n > 0 ? n : std::min(max_bytes, s.size() - from);
}

} // namespace

void InputEncoder::frame(std::vector<uint8_t>& out, uint8_t cmd, const std::vector<uint8_t>& payload) {
    append_frame(out, cmd, seq_++, payload);
}

void InputEncoder::point(std::vector<uint8_t>& out, uint8_t cmd, int32_t x, int32_t y) {
    std::vector<uint8_t> p;
    put_i32(p, x);
    put_i32(p, y);
    frame(out, cmd, p);
}

void InputEncoder::wait(std::vector<uint8_t>& out, uint32_t ms) {
    std::vector<uint8_t> p;
    put_u32(p, ms);
    frame(out, CMD_WAIT, p);
}

void InputEncoder::text(std::vector<uint8_t>& out, uint8_t flags, const std::string& utf8) {
    // flags(1) + length(4) + text must fit one frame; long text spans several
    const size_t max_text = MAX_PAYLOAD - 5;
    size_t pos = 0;
    do {
        size_t n = utf8Prefix(utf8, pos, max_text);
        std::vector<uint8_t> p;
        p.push_back(flags);
        put_string(p, utf8.substr(pos, n));
        frame(out, CMD_TEXT, p);
        pos += n;
    } while (pos < utf8.size());
}

std::vector<uint8_t> InputEncoder::encode(const InputEvent& event) {
    std::vector<uint8_t> out;

    if (const auto* tap = std::get_if<Tap>(&event)) {
        point(out, CMD_TOUCH_DOWN, tap->x, tap->y);
        point(out, CMD_TOUCH_UP, tap->x, tap->y);
    } else if (const auto* lp = std::get_if<LongPress>(&event)) {
        point(out, CMD_TOUCH_DOWN, lp->x, lp->y);
        wait(out, lp->duration_ms);
        point(out, CMD_TOUCH_UP, lp->x, lp->y);
    } else if (const auto* sw = std::get_if<Swipe>(&event)) {
        uint32_t steps = std::max<uint32_t>(1, sw->duration_ms / static_cast<uint32_t>(swipe_step_ms_));
        uint32_t step_ms = sw->duration_ms / steps;
        point(out, CMD_TOUCH_DOWN, sw->x0, sw->y0);
        for (uint32_t i = 1; i <= steps; i++) {
            // Last step absorbs the rounding remainder so the waits sum to duration
            wait(out, i == steps ? sw->duration_ms - step_ms * (steps - 1) : step_ms);
            int32_t x = sw->x0 + static_cast<int32_t>(static_cast<int64_t>(sw->x1 - sw->x0) * i / steps);
            int32_t y = sw->y0 + static_cast<int32_t>(static_cast<int64_t>(sw->y1 - sw->y0) * i / steps);
            point(out, CMD_TOUCH_MOVE, x, y);
        }
        point(out, CMD_TOUCH_UP, sw->x1, sw->y1);
    } else if (const auto* sc = std::get_if<Scroll>(&event)) {
        std::vector<uint8_t> p;
        put_i32(p, sc->x);
        put_i32(p, sc->y);
        put_i32(p, sc->dx);
        put_i32(p, sc->dy);
        frame(out, CMD_SCROLL, p);
    } else if (const auto* kt = std::get_if<KeyText>(&event)) {
        text(out, TEXT_TYPED, kt->utf8);
    } else if (const auto* key = std::get_if<Key>(&event)) {
        std::vector<uint8_t> p;
        put_i32(p, key->code);
        frame(out, CMD_KEY, p);
    } else if (const auto* paste = std::get_if<Paste>(&event)) {
        text(out, TEXT_PASTE, paste->utf8);
    }

    return out;
}

} // namespace scry
