// =============================================================================
// Scry - ADB Command Translator
// =============================================================================
// Turns decoded control frames into `adb shell` command lines. Touch frames are
// collected until TOUCH_UP so a whole gesture becomes one `input` command.
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "result.hpp"
#include "scry_protocol.hpp"

namespace scry {

// Duration of the swipe that renders one SCROLL frame
static constexpr int SCROLL_SWIPE_MS = 100;

/**
 * Stateful translator for one control channel.
 *
 * translate() returns zero or more shell lines (without trailing newline).
 * Zero lines means the frame was consumed into a pending gesture. Malformed
 * payloads and touch frames outside a gesture fail with ErrorKind::Config and
 * reset the pending gesture.
 */
class AdbCommandTranslator {
public:
    Result<std::vector<std::string>> translate(const protocol::Frame& frame);

    bool gestureActive() const { return gesture_.active; }
    void reset() { gesture_ = Gesture{}; }

    // Helpers exposed for tests
    static std::string base64Encode(const std::string& data);
    static bool isPlainAscii(const std::string& text);

private:
    struct Gesture {
        bool active = false;
        bool moved = false;
        int32_t x0 = 0, y0 = 0;
        int32_t x = 0, y = 0;
        uint32_t wait_ms = 0;
    };

    Result<std::vector<std::string>> touch(const protocol::Frame& frame);
    Result<std::vector<std::string>> text(const protocol::Frame& frame);
    Result<std::vector<std::string>> openFile(const protocol::Frame& frame);

    Gesture gesture_;
};

} // namespace scry
