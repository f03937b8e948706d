// =============================================================================
// Scry - ADB Command Translator Implementation
// =============================================================================
#include "adb_command_translator.hpp"
#include "adb_security.hpp"
#include "scry_log.hpp"

namespace scry {

using namespace protocol;

namespace {

const char BASE64_TABLE[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

Error malformed(uint8_t cmd) {
    return Error(ErrorKind::Config, std::string("Malformed ") + cmd_name(cmd) + " frame");
}

std::string fileUri(const std::string& path) {
    return security::quoteShellArg("file://" + path);
}

} // namespace

std::string AdbCommandTranslator::base64Encode(const std::string& data) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    const size_t len = data.size();
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(bytes[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(bytes[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(bytes[i + 2]);

        result.push_back(BASE64_TABLE[(n >> 18) & 0x3F]);
        result.push_back(BASE64_TABLE[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? BASE64_TABLE[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? BASE64_TABLE[n & 0x3F] : '=');
    }
    return result;
}

bool AdbCommandTranslator::isPlainAscii(const std::string& text) {
    for (char c : text) {
        auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u > 0x7E) return false;
    }
    return true;
}

Result<std::vector<std::string>> AdbCommandTranslator::translate(const Frame& frame) {
    switch (frame.cmd) {
        case CMD_TOUCH_DOWN:
        case CMD_TOUCH_MOVE:
        case CMD_TOUCH_UP:
        case CMD_WAIT:
            return touch(frame);

        case CMD_SCROLL: {
            if (frame.payload.size() != 16) return malformed(frame.cmd);
            const uint8_t* p = frame.payload.data();
            int32_t x = get_i32(p), y = get_i32(p + 4);
            int32_t dx = get_i32(p + 8), dy = get_i32(p + 12);
            // Positive dy scrolls content down: the finger moves up across the anchor
            std::vector<std::string> lines;
            lines.push_back("input swipe " + std::to_string(x + dx) + " " + std::to_string(y + dy) + " " +
                            std::to_string(x - dx) + " " + std::to_string(y - dy) + " " +
                            std::to_string(SCROLL_SWIPE_MS));
            return lines;
        }

        case CMD_TEXT:
            return text(frame);

        case CMD_KEY: {
            if (frame.payload.size() != 4) return malformed(frame.cmd);
            std::vector<std::string> lines;
            lines.push_back("input keyevent " + std::to_string(get_i32(frame.payload.data())));
            return lines;
        }

        case CMD_OPEN_FILE:
            return openFile(frame);

        default:
            SLOG_WARN("adb_cmd", "Unsupported control command 0x%02x (%s)", frame.cmd, cmd_name(frame.cmd));
            return Error(ErrorKind::Config, std::string("Unsupported control command ") + cmd_name(frame.cmd));
    }
}

Result<std::vector<std::string>> AdbCommandTranslator::touch(const Frame& frame) {
    if (frame.cmd == CMD_WAIT) {
        if (frame.payload.size() != 4) { reset(); return malformed(frame.cmd); }
        // A WAIT between gestures has nothing to pace
        if (gesture_.active) gesture_.wait_ms += get_u32(frame.payload.data());
        return std::vector<std::string>{};
    }

    if (frame.payload.size() != 8) { reset(); return malformed(frame.cmd); }
    int32_t x = get_i32(frame.payload.data());
    int32_t y = get_i32(frame.payload.data() + 4);

    if (frame.cmd == CMD_TOUCH_DOWN) {
        if (gesture_.active) SLOG_WARN("adb_cmd", "TOUCH_DOWN inside a gesture, restarting");
        gesture_ = Gesture{};
        gesture_.active = true;
        gesture_.x0 = gesture_.x = x;
        gesture_.y0 = gesture_.y = y;
        return std::vector<std::string>{};
    }

    if (!gesture_.active) {
        return Error(ErrorKind::Config, std::string(cmd_name(frame.cmd)) + " without TOUCH_DOWN");
    }

    gesture_.x = x;
    gesture_.y = y;
    if (frame.cmd == CMD_TOUCH_MOVE) {
        gesture_.moved = true;
        return std::vector<std::string>{};
    }

    // TOUCH_UP completes the gesture
    Gesture g = gesture_;
    reset();

    std::vector<std::string> lines;
    bool displaced = g.moved || g.x != g.x0 || g.y != g.y0;
    if (!displaced && g.wait_ms == 0) {
        lines.push_back("input tap " + std::to_string(g.x0) + " " + std::to_string(g.y0));
    } else {
        std::string line = "input swipe " + std::to_string(g.x0) + " " + std::to_string(g.y0) + " " +
                           std::to_string(g.x) + " " + std::to_string(g.y);
        if (g.wait_ms > 0) line += " " + std::to_string(g.wait_ms);
        lines.push_back(line);
    }
    return lines;
}

Result<std::vector<std::string>> AdbCommandTranslator::text(const Frame& frame) {
    if (frame.payload.empty()) return malformed(frame.cmd);
    uint8_t flags = frame.payload[0];
    std::vector<uint8_t> rest(frame.payload.begin() + 1, frame.payload.end());
    size_t offset = 0;
    std::string utf8;
    if (!get_string(rest, offset, utf8) || offset != rest.size()) return malformed(frame.cmd);

    std::vector<std::string> lines;
    if (utf8.empty()) return lines;

    // `input text` expands %s to a space, so any '%' goes through the IME too
    if (isPlainAscii(utf8) && utf8.find('%') == std::string::npos) {
        std::string escaped;
        escaped.reserve(utf8.size());
        for (char c : utf8) {
            if (c == ' ') escaped += "%s";
            else escaped += c;
        }
        lines.push_back("input text " + security::quoteShellArg(escaped));
    } else {
        // Needs the ADB keyboard IME on the device
        lines.push_back("am broadcast -a ADB_INPUT_B64 --es msg " + base64Encode(utf8));
    }
    SLOG_DEBUG("adb_cmd", "TEXT (%s) %zu bytes", flags == TEXT_PASTE ? "paste" : "typed", utf8.size());
    return lines;
}

Result<std::vector<std::string>> AdbCommandTranslator::openFile(const Frame& frame) {
    size_t offset = 0;
    std::string path, mime;
    if (!get_string(frame.payload, offset, path) || !get_string(frame.payload, offset, mime) ||
        offset != frame.payload.size()) {
        return malformed(frame.cmd);
    }
    if (!security::isAllowedRemotePath(path)) {
        SLOG_ERROR("adb_cmd", "OPEN_FILE path rejected: %s", path.c_str());
        return Error(ErrorKind::Config, "OPEN_FILE path not allowed: " + path);
    }
    if (mime.empty()) mime = "*/*";

    std::vector<std::string> lines;
    lines.push_back("am broadcast -a android.intent.action.MEDIA_SCANNER_SCAN_FILE -d " + fileUri(path));
    lines.push_back("am start -a android.intent.action.VIEW -d " + fileUri(path) + " -t " +
                    security::quoteShellArg(mime));
    return lines;
}

} // namespace scry
