// =============================================================================
// Scry - Decode Pump
// =============================================================================
// Decode-thread loop: VideoSource -> FrameDecoder -> FrameSlot.
// Owns the error policy: an isolated bad unit is skipped, a run of
// max_consecutive_errors bad units is fatal for the stream.
// =============================================================================
#pragma once

#include <atomic>
#include <cstdint>

#include "frame_decoder.hpp"
#include "video_source.hpp"
#include "../frame_slot.hpp"
#include "../result.hpp"

namespace scry::video {

class DecodePump {
public:
  enum class Exit { EndOfStream, Stopped };
  enum class Step { Frame, NoFrame, Dropped, EndOfStream };

  DecodePump(VideoSource& source, FrameDecoder& decoder, FrameSlot& slot, int max_consecutive_errors);

  // Loops until the source ends or requestStop(). A fatal error (decode
  // escalation, source read failure) is returned as the error.
  Result<Exit> run();

  // Pulls and decodes one unit. Err only when fatal.
  Result<Step> step();

  void requestStop() { stop_requested_.store(true); }

  uint64_t units() const { return units_.load(); }
  uint64_t frames() const { return frames_.load(); }
  uint64_t dropped_units() const { return dropped_units_.load(); }
  int consecutive_errors() const { return consecutive_errors_; }

private:
  VideoSource& source_;
  FrameDecoder& decoder_;
  FrameSlot& slot_;
  int max_consecutive_errors_;

  int consecutive_errors_ = 0;
  std::atomic<bool> stop_requested_{false};
  std::atomic<uint64_t> units_{0};
  std::atomic<uint64_t> frames_{0};
  std::atomic<uint64_t> dropped_units_{0};
};

} // namespace scry::video
