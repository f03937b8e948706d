#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include <memory>

#include "frame_decoder.hpp"

// Forward declarations for FFmpeg types
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace scry::video {

/**
 * H.264 Decoder using FFmpeg.
 * - Input: Annex-B access units (with 00 00 00 01 start codes)
 * - Output: tightly packed RGBA frames at the stream's native size
 *
 * Configured for latency over robustness: LOW_DELAY, a single thread and no
 * frame reordering, so every picture leaves the decoder with the unit that
 * carried it. Pictures the decoder flags as corrupt are dropped, never shown.
 *
 * Thread Safety:
 * - The decoder itself is NOT thread-safe
 */
class H264Decoder : public FrameDecoder {
public:
  H264Decoder();
  ~H264Decoder() override;

  // Non-copyable, non-movable (owns FFmpeg resources)
  H264Decoder(const H264Decoder&) = delete;
  H264Decoder& operator=(const H264Decoder&) = delete;
  H264Decoder(H264Decoder&&) = delete;
  H264Decoder& operator=(H264Decoder&&) = delete;

  // Initialize decoder
  bool init();

  // init() wrapped for DecoderFactory
  static Result<std::unique_ptr<FrameDecoder>> create();

  Result<std::optional<DecodedFrame>> feed(const AccessUnit& unit) override;

  // Stats
  uint64_t units_fed() const { return units_fed_; }
  uint64_t frames_decoded() const { return frames_decoded_; }
  uint64_t error_count() const { return error_count_; }
  uint64_t corrupt_dropped() const { return corrupt_dropped_; }

  bool is_initialized() const { return codec_ctx_ != nullptr; }

  // Structural check done before the bitstream reaches FFmpeg: a start code
  // at offset 0 and forbidden_zero_bit clear in every NAL header.
  static bool is_well_formed(const uint8_t* data, size_t len, const char** why);

private:
  bool convert_frame_to_rgba(AVFrame* frame, DecodedFrame& out);

  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVFrame* frame_rgba_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  int last_width_ = 0;
  int last_height_ = 0;
  int last_format_ = -1;

  uint64_t units_fed_ = 0;
  uint64_t frames_decoded_ = 0;
  uint64_t corrupt_dropped_ = 0;

  // Error counters (per-instance, not static)
  uint64_t error_count_ = 0;
  uint64_t send_packet_errors_ = 0;
  uint64_t receive_frame_errors_ = 0;
};

} // namespace scry::video
