// =============================================================================
// Scry - Transport Channel
// =============================================================================
// A connection to one device that opens independent sub-channels (video,
// control, file push) addressed by device id.
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include "result.hpp"

namespace scry {

enum class ChannelKind { Video, Control, FilePush };

inline const char* channelKindName(ChannelKind k) {
    switch (k) {
        case ChannelKind::Video:    return "video";
        case ChannelKind::Control:  return "control";
        case ChannelKind::FilePush: return "filepush";
    }
    return "?";
}

// Remote capture parameters; only the Video channel uses them
struct VideoOptions {
    int width = 720;
    int height = 1600;
    int bit_rate = 8000000;
};

/**
 * One logical sub-channel.
 *
 * write() delivers the whole buffer or fails; callers pass complete frames so
 * frames are never interleaved across calls. readChunk() blocks until at least
 * one byte is available and returns 0 at end of stream. close() is idempotent
 * and makes blocked or later reads/writes fail fast.
 */
class Stream {
public:
    virtual ~Stream() = default;

    virtual Result<void> write(const uint8_t* data, size_t len) = 0;
    virtual Result<size_t> readChunk(uint8_t* buf, size_t cap) = 0;
    virtual void close() = 0;
    virtual ChannelKind kind() const = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Fails with ErrorKind::Connection for unknown ids or a rejected request
    virtual Result<std::unique_ptr<Stream>> open(const std::string& device_id, ChannelKind kind,
                                                 const VideoOptions& video) = 0;

    // False when all sub-channels share one physical link without true
    // multiplexing; SharedLink then serializes their writes.
    virtual bool multiplexed() const { return true; }
};

/**
 * Serializes physical writes of several streams that share one link.
 * The lock covers a single write() so one frame can never be split by a frame
 * from another sub-channel. Reads are not serialized.
 */
class SerializedStream : public Stream {
public:
    SerializedStream(std::unique_ptr<Stream> inner, std::shared_ptr<std::mutex> link_mutex)
        : inner_(std::move(inner)), link_mutex_(std::move(link_mutex)) {}

    Result<void> write(const uint8_t* data, size_t len) override {
        std::lock_guard<std::mutex> lock(*link_mutex_);
        return inner_->write(data, len);
    }
    Result<size_t> readChunk(uint8_t* buf, size_t cap) override { return inner_->readChunk(buf, cap); }
    void close() override { inner_->close(); }
    ChannelKind kind() const override { return inner_->kind(); }

private:
    std::unique_ptr<Stream> inner_;
    std::shared_ptr<std::mutex> link_mutex_;
};

/**
 * Opens a stream and, when the transport is not multiplexed, wraps it so its
 * writes are mutually exclusive with every other stream of that transport.
 * All channel users go through this instead of Transport::open().
 */
class SharedLink {
public:
    explicit SharedLink(std::shared_ptr<Transport> transport)
        : transport_(std::move(transport)), link_mutex_(std::make_shared<std::mutex>()) {}

    Result<std::unique_ptr<Stream>> open(const std::string& device_id, ChannelKind kind,
                                         const VideoOptions& video = VideoOptions{}) {
        auto r = transport_->open(device_id, kind, video);
        if (r.is_err() || transport_->multiplexed()) return r;
        std::unique_ptr<Stream> wrapped =
            std::make_unique<SerializedStream>(std::move(r).value(), link_mutex_);
        return Result<std::unique_ptr<Stream>>(std::move(wrapped));
    }

    Transport& transport() { return *transport_; }

private:
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<std::mutex> link_mutex_;
};

} // namespace scry
