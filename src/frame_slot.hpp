// =============================================================================
// Scry - Frame Slot
// =============================================================================
// Single-slot hand-off between the decode thread and the render consumer.
// Newer frames overwrite older ones; the renderer always sees the latest.
// =============================================================================
#pragma once
#include "video/video_types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace scry {

class FrameSlot {
public:
    // Stores frame as the latest, discarding an untaken predecessor.
    void publish(video::DecodedFrame frame) {
        auto incoming = std::make_unique<video::DecodedFrame>(std::move(frame));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            incoming.swap(slot_);
        }
        published_.fetch_add(1, std::memory_order_relaxed);
        // incoming now holds the overwritten frame, freed here outside the lock
        if (incoming) dropped_.fetch_add(1, std::memory_order_relaxed);
    }

    // Latest frame since the previous call, or nullopt if none arrived.
    std::optional<video::DecodedFrame> takeLatest() {
        std::unique_ptr<video::DecodedFrame> taken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            taken.swap(slot_);
        }
        if (!taken) return std::nullopt;
        taken_.fetch_add(1, std::memory_order_relaxed);
        return std::optional<video::DecodedFrame>(std::move(*taken));
    }

    // Drops a pending frame (session teardown)
    void clear() {
        std::unique_ptr<video::DecodedFrame> old;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            old.swap(slot_);
        }
    }

    bool hasFrame() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slot_ != nullptr;
    }

    uint64_t published() const { return published_.load(std::memory_order_relaxed); }
    uint64_t taken() const { return taken_.load(std::memory_order_relaxed); }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    mutable std::mutex mutex_;
    std::unique_ptr<video::DecodedFrame> slot_;
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> taken_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace scry
