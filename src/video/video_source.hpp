// =============================================================================
// Scry - Video Source
// =============================================================================
// Opens the Video channel and turns the recorder's byte stream into an ordered
// sequence of access units. A source ends exactly once; restart by creating a
// new one.
// =============================================================================
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "annexb_splitter.hpp"
#include "video_types.hpp"
#include "../result.hpp"
#include "../transport.hpp"

namespace scry::video {

class VideoSource {
public:
  /**
   * Starts the remote capture and waits for its first bytes.
   * Errors:
   *   CaptureUnavailable - the device answered with a capture denial
   *   Connection         - channel could not be opened, or it closed / sent
   *                        something other than H.264 before any video
   */
  static Result<std::unique_ptr<VideoSource>> start(SharedLink& link, const std::string& device_id,
                                                    const VideoOptions& options);

  ~VideoSource();

  VideoSource(const VideoSource&) = delete;
  VideoSource& operator=(const VideoSource&) = delete;

  // Blocks for the next unit. nullopt = end of stream (disconnect or stop()),
  // and every later call returns nullopt too. Read errors before stop() are
  // returned as ErrorKind::Connection and also end the sequence.
  Result<std::optional<AccessUnit>> next();

  // Closes the channel; a blocked next() returns end of stream. Idempotent.
  void stop();

  bool ended() const { return ended_.load(); }
  uint64_t units_produced() const { return next_seq_.load(); }
  uint64_t bytes_received() const { return bytes_received_.load(); }

  // True when recorder output text reads like a refused capture
  static bool looks_like_capture_denial(const std::string& text);

private:
  explicit VideoSource(std::unique_ptr<Stream> stream);

  Result<void> prime();
  bool fill();  // reads one chunk into pending_; false at end of stream

  std::unique_ptr<Stream> stream_;
  AnnexBSplitter splitter_;
  std::deque<std::vector<uint8_t>> pending_;
  std::vector<uint8_t> read_buf_;
  std::atomic<uint64_t> next_seq_{0};
  std::atomic<uint64_t> bytes_received_{0};
  std::atomic<bool> stopped_{false};
  std::atomic<bool> ended_{false};
  bool source_done_ = false;      // channel hit EOF or failed; drain pending_ then end
  std::optional<Error> read_error_;
};

} // namespace scry::video
