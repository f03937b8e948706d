// =============================================================================
// Scry - Protocol Constants & Utilities
// =============================================================================
// Self-delimiting frame encoding shared by the Control and FilePush channels.
// Every command is one frame, so a channel never needs external framing hints.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

namespace scry::protocol {

static constexpr uint32_t PROTOCOL_MAGIC = 0x59524353;  // "SCRY" little-endian
static constexpr uint8_t PROTOCOL_VERSION = 1;

// Packet header (14 bytes):
//   magic:   4 bytes (0x59524353 = "SCRY" LE)
//   version: 1 byte  (1)
//   cmd:     1 byte
//   seq:     4 bytes
//   len:     4 bytes (payload length)
static constexpr size_t HEADER_SIZE = 14;

// Control commands (host -> device). Coordinates are device pixels.
static constexpr uint8_t CMD_TOUCH_DOWN = 0x01;
static constexpr uint8_t CMD_TOUCH_MOVE = 0x02;
static constexpr uint8_t CMD_TOUCH_UP   = 0x03;
static constexpr uint8_t CMD_WAIT       = 0x04;
static constexpr uint8_t CMD_SCROLL     = 0x05;
static constexpr uint8_t CMD_TEXT       = 0x06;
static constexpr uint8_t CMD_KEY        = 0x07;
static constexpr uint8_t CMD_OPEN_FILE  = 0x08;

// File push commands (host -> device)
static constexpr uint8_t CMD_SEND = 0x20;
static constexpr uint8_t CMD_DATA = 0x21;
static constexpr uint8_t CMD_DONE = 0x22;

// Replies (device -> host)
static constexpr uint8_t CMD_OKAY = 0x30;
static constexpr uint8_t CMD_FAIL = 0x31;

// TEXT flags
static constexpr uint8_t TEXT_TYPED = 0x00;
static constexpr uint8_t TEXT_PASTE = 0x01;

static constexpr size_t MAX_PAYLOAD = 64 * 1024;

struct PacketHeader {
    uint32_t magic;
    uint8_t  version;
    uint8_t  cmd;
    uint32_t seq;
    uint32_t payload_len;
};

// =============================================================================
// Little-endian field helpers
// =============================================================================
inline void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 24));
}

inline void put_i32(std::vector<uint8_t>& out, int32_t v) {
    put_u32(out, static_cast<uint32_t>(v));
}

inline uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline int32_t get_i32(const uint8_t* p) {
    return static_cast<int32_t>(get_u32(p));
}

// =============================================================================
// Header builder / parser
// =============================================================================
inline void build_header(std::vector<uint8_t>& out, uint8_t cmd, uint32_t seq, uint32_t payload_len) {
    put_u32(out, PROTOCOL_MAGIC);
    out.push_back(PROTOCOL_VERSION);
    out.push_back(cmd);
    put_u32(out, seq);
    put_u32(out, payload_len);
}

// Returns true if buf holds a valid SCRY header
inline bool parse_header(const uint8_t* buf, size_t len, PacketHeader& out) {
    if (len < HEADER_SIZE) return false;
    out.magic = get_u32(buf);
    if (out.magic != PROTOCOL_MAGIC) return false;
    out.version = buf[4];
    out.cmd = buf[5];
    out.seq = get_u32(buf + 6);
    out.payload_len = get_u32(buf + 10);
    return out.version == PROTOCOL_VERSION && out.payload_len <= MAX_PAYLOAD;
}

// Append a full frame (header + payload) to out
inline void append_frame(std::vector<uint8_t>& out, uint8_t cmd, uint32_t seq,
                         const uint8_t* payload = nullptr, size_t payload_len = 0) {
    build_header(out, cmd, seq, static_cast<uint32_t>(payload_len));
    if (payload && payload_len > 0) {
        out.insert(out.end(), payload, payload + payload_len);
    }
}

inline void append_frame(std::vector<uint8_t>& out, uint8_t cmd, uint32_t seq,
                         const std::vector<uint8_t>& payload) {
    append_frame(out, cmd, seq, payload.data(), payload.size());
}

// Length-prefixed UTF-8 string field
inline void put_string(std::vector<uint8_t>& out, const std::string& s) {
    put_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

// Reads a length-prefixed string at offset; advances offset. False on truncation.
inline bool get_string(const std::vector<uint8_t>& in, size_t& offset, std::string& out) {
    if (offset + 4 > in.size()) return false;
    uint32_t len = get_u32(in.data() + offset);
    offset += 4;
    if (len > in.size() - offset) return false;
    out.assign(reinterpret_cast<const char*>(in.data() + offset), len);
    offset += len;
    return true;
}

// =============================================================================
// Decoded frame + incremental reader
// =============================================================================
struct Frame {
    uint8_t cmd = 0;
    uint32_t seq = 0;
    std::vector<uint8_t> payload;
};

/**
 * Accumulates bytes from a byte stream and yields complete frames.
 * Partial frames stay buffered until the rest arrives.
 * A bad magic/version/length marks the reader corrupt; it yields nothing after.
 */
class FrameReader {
public:
    void append(const uint8_t* data, size_t len) {
        if (corrupt_) return;
        buf_.insert(buf_.end(), data, data + len);
    }

    bool next(Frame& out) {
        if (corrupt_) return false;
        if (buf_.size() - pos_ < HEADER_SIZE) { compact(); return false; }
        PacketHeader hdr;
        if (!parse_header(buf_.data() + pos_, buf_.size() - pos_, hdr)) {
            corrupt_ = true;
            buf_.clear();
            pos_ = 0;
            return false;
        }
        if (buf_.size() - pos_ < HEADER_SIZE + hdr.payload_len) { compact(); return false; }
        out.cmd = hdr.cmd;
        out.seq = hdr.seq;
        const uint8_t* p = buf_.data() + pos_ + HEADER_SIZE;
        out.payload.assign(p, p + hdr.payload_len);
        pos_ += HEADER_SIZE + hdr.payload_len;
        return true;
    }

    bool corrupt() const { return corrupt_; }
    size_t buffered() const { return buf_.size() - pos_; }

private:
    void compact() {
        if (pos_ > 0) {
            buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
            pos_ = 0;
        }
    }

    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
    bool corrupt_ = false;
};

// =============================================================================
// Command name for logging
// =============================================================================
inline const char* cmd_name(uint8_t cmd) {
    switch (cmd) {
        case CMD_TOUCH_DOWN: return "TOUCH_DOWN";
        case CMD_TOUCH_MOVE: return "TOUCH_MOVE";
        case CMD_TOUCH_UP:   return "TOUCH_UP";
        case CMD_WAIT:       return "WAIT";
        case CMD_SCROLL:     return "SCROLL";
        case CMD_TEXT:       return "TEXT";
        case CMD_KEY:        return "KEY";
        case CMD_OPEN_FILE:  return "OPEN_FILE";
        case CMD_SEND:       return "SEND";
        case CMD_DATA:       return "DATA";
        case CMD_DONE:       return "DONE";
        case CMD_OKAY:       return "OKAY";
        case CMD_FAIL:       return "FAIL";
        default:             return "UNKNOWN";
    }
}

} // namespace scry::protocol
