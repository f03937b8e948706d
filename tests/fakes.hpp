// =============================================================================
// Scry - In-memory test doubles for transport, decoder and device provider
// =============================================================================
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "device_provider.hpp"
#include "result.hpp"
#include "scry_protocol.hpp"
#include "transport.hpp"
#include "video/frame_decoder.hpp"

namespace scry::fakes {

// Polls pred every 5ms until true or timeout
inline bool waitFor(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// =============================================================================
// FakeStream
// =============================================================================

// Shared between a FakeStream and the test that inspects it
struct FakeStreamState {
    ChannelKind kind = ChannelKind::Control;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::vector<uint8_t>> writes;   // one entry per write() call
    std::deque<uint8_t> readable;
    bool eof = false;       // readChunk returns 0 once readable is drained
    bool closed = false;

    // Runs before a write is recorded; an error fails the write
    std::function<Result<void>(const std::vector<uint8_t>&)> write_hook;
    // Runs after a write is recorded, outside the lock (replies, bookkeeping)
    std::function<void(FakeStreamState&, const std::vector<uint8_t>&)> after_write;

    void feed(const std::vector<uint8_t>& bytes) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            readable.insert(readable.end(), bytes.begin(), bytes.end());
        }
        cv.notify_all();
    }

    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            eof = true;
        }
        cv.notify_all();
    }

    size_t writeCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return writes.size();
    }

    std::vector<std::vector<uint8_t>> writesCopy() {
        std::lock_guard<std::mutex> lock(mutex);
        return writes;
    }

    bool isClosed() {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }
};

class FakeStream : public Stream {
public:
    explicit FakeStream(std::shared_ptr<FakeStreamState> state) : state_(std::move(state)) {}
    ~FakeStream() override { close(); }

    Result<void> write(const uint8_t* data, size_t len) override {
        std::vector<uint8_t> bytes(data, data + len);
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) return Error(ErrorKind::Connection, "stream closed");
        }
        if (state_->write_hook) {
            auto r = state_->write_hook(bytes);
            if (r.is_err()) return r;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->writes.push_back(bytes);
        }
        state_->cv.notify_all();
        if (state_->after_write) state_->after_write(*state_, bytes);
        return {};
    }

    Result<size_t> readChunk(uint8_t* buf, size_t cap) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] {
            return state_->closed || state_->eof || !state_->readable.empty();
        });
        if (state_->closed) return Error(ErrorKind::Connection, "stream closed");
        size_t n = std::min(cap, state_->readable.size());
        for (size_t i = 0; i < n; i++) {
            buf[i] = state_->readable.front();
            state_->readable.pop_front();
        }
        return n;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
        }
        state_->cv.notify_all();
    }

    ChannelKind kind() const override { return state_->kind; }

private:
    std::shared_ptr<FakeStreamState> state_;
};

// =============================================================================
// FakeTransport
// =============================================================================

/**
 * Devices listed in `devices` accept channels, anything else is a
 * Connection error. Every open() gets a fresh FakeStreamState:
 *   Video    - preloaded with video_bytes; live streams never reach EOF
 *   Control  - records writes
 *   FilePush - answers DONE with OKAY, or FAIL(reject_message) when set
 */
class FakeTransport : public Transport {
public:
    std::vector<std::string> devices{"DEVICE1"};
    std::vector<uint8_t> video_bytes;
    bool video_live = true;
    bool is_multiplexed = true;
    std::string reject_message;     // non-empty: file push answers FAIL
    std::function<Result<void>(ChannelKind)> open_hook;
    std::function<Result<void>(const std::vector<uint8_t>&)> control_write_hook;

    Result<std::unique_ptr<Stream>> open(const std::string& device_id, ChannelKind kind,
                                         const VideoOptions& video) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_attempts_[kind]++;
            last_video_ = video;
        }
        if (std::find(devices.begin(), devices.end(), device_id) == devices.end()) {
            return Error(ErrorKind::Connection, "unknown device " + device_id);
        }
        if (open_hook) {
            auto r = open_hook(kind);
            if (r.is_err()) return r.error();
        }

        auto state = std::make_shared<FakeStreamState>();
        state->kind = kind;
        if (kind == ChannelKind::Video) {
            state->readable.assign(video_bytes.begin(), video_bytes.end());
            state->eof = !video_live;
        } else if (kind == ChannelKind::Control) {
            state->write_hook = control_write_hook;
        } else {
            std::string reject = reject_message;
            auto reader = std::make_shared<protocol::FrameReader>();
            state->after_write = [reader, reject](FakeStreamState& s, const std::vector<uint8_t>& bytes) {
                reader->append(bytes.data(), bytes.size());
                protocol::Frame f;
                while (reader->next(f)) {
                    if (f.cmd != protocol::CMD_DONE) continue;
                    std::vector<uint8_t> reply;
                    if (reject.empty()) {
                        protocol::append_frame(reply, protocol::CMD_OKAY, 0);
                    } else {
                        protocol::append_frame(reply, protocol::CMD_FAIL, 0,
                                               reinterpret_cast<const uint8_t*>(reject.data()), reject.size());
                    }
                    s.feed(reply);
                }
            };
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            streams_[kind].push_back(state);
        }
        std::unique_ptr<Stream> stream = std::make_unique<FakeStream>(state);
        return Result<std::unique_ptr<Stream>>(std::move(stream));
    }

    bool multiplexed() const override { return is_multiplexed; }

    // Successful opens of kind
    size_t opened(ChannelKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        return streams_[kind].size();
    }

    size_t openAttempts(ChannelKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_attempts_[kind];
    }

    std::shared_ptr<FakeStreamState> stream(ChannelKind kind, size_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& list = streams_[kind];
        return index < list.size() ? list[index] : nullptr;
    }

    VideoOptions lastVideoOptions() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_video_;
    }

private:
    std::mutex mutex_;
    std::map<ChannelKind, std::vector<std::shared_ptr<FakeStreamState>>> streams_;
    std::map<ChannelKind, size_t> open_attempts_;
    VideoOptions last_video_;
};

// =============================================================================
// Synthetic H.264 units
// =============================================================================

// Byte that marks a unit the FakeDecoder rejects
static constexpr uint8_t CORRUPT_MARK = 0xEE;

// One IDR slice NAL with first_mb_in_slice == 0, so each call starts a new unit
inline std::vector<uint8_t> sliceUnit(bool corrupt = false, uint8_t tag = 0x11) {
    return {0x00, 0x00, 0x00, 0x01, 0x65, 0x88, corrupt ? CORRUPT_MARK : static_cast<uint8_t>(0xAA), tag};
}

// Units back to back. On a live stream the splitter holds back the last one
// until the next unit starts.
inline std::vector<uint8_t> unitStream(const std::vector<bool>& corrupt) {
    std::vector<uint8_t> out;
    uint8_t tag = 1;
    for (bool c : corrupt) {
        auto u = sliceUnit(c, tag++);
        out.insert(out.end(), u.begin(), u.end());
    }
    return out;
}

// =============================================================================
// FakeDecoder
// =============================================================================

struct FakeDecoderStats {
    std::atomic<int> created{0};
    std::atomic<int> fed{0};
    std::atomic<int> failed{0};
    std::atomic<int> frames{0};
};

/**
 * Units containing CORRUPT_MARK fail with ErrorKind::Decode; every other unit
 * yields a 2x2 frame. fail_all makes every unit fail.
 */
class FakeDecoder : public video::FrameDecoder {
public:
    FakeDecoder(std::shared_ptr<FakeDecoderStats> stats, bool fail_all)
        : stats_(std::move(stats)), fail_all_(fail_all) {
        stats_->created++;
    }

    Result<std::optional<video::DecodedFrame>> feed(const video::AccessUnit& unit) override {
        stats_->fed++;
        bool corrupt = fail_all_ ||
            std::find(unit.data.begin(), unit.data.end(), CORRUPT_MARK) != unit.data.end();
        if (corrupt) {
            stats_->failed++;
            return Error(ErrorKind::Decode, "corrupt unit " + std::to_string(unit.seq));
        }
        video::DecodedFrame frame;
        frame.width = 2;
        frame.height = 2;
        frame.rgba.assign(2 * 2 * 4, static_cast<uint8_t>(unit.seq));
        frame.index = next_index_++;
        stats_->frames++;
        return std::optional<video::DecodedFrame>(std::move(frame));
    }

private:
    std::shared_ptr<FakeDecoderStats> stats_;
    bool fail_all_;
    uint64_t next_index_ = 0;
};

inline video::DecoderFactory fakeDecoderFactory(std::shared_ptr<FakeDecoderStats> stats, bool fail_all = false) {
    return [stats, fail_all]() -> Result<std::unique_ptr<video::FrameDecoder>> {
        std::unique_ptr<video::FrameDecoder> d = std::make_unique<FakeDecoder>(stats, fail_all);
        return Result<std::unique_ptr<video::FrameDecoder>>(std::move(d));
    };
}

// =============================================================================
// FakeDeviceProvider
// =============================================================================

class FakeDeviceProvider : public DeviceProvider {
public:
    explicit FakeDeviceProvider(std::vector<std::string> ids) : ids_(std::move(ids)) {}

    Result<std::vector<std::string>> listDevices() override {
        calls++;
        if (fail) return Error(ErrorKind::Connection, "enumeration unavailable");
        return ids_;
    }

    bool fail = false;
    std::atomic<int> calls{0};

private:
    std::vector<std::string> ids_;
};

} // namespace scry::fakes
