#include "video_source.hpp"

#include <algorithm>
#include <cctype>

#include "../scry_log.hpp"

namespace scry::video {

namespace {
constexpr size_t READ_CHUNK = 64 * 1024;
constexpr size_t MAX_DIAGNOSTIC_BYTES = 4096;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string printable(const std::vector<uint8_t>& bytes) {
  std::string text;
  for (uint8_t b : bytes) {
    if (b == '\n' || b == '\r' || b == '\t') text += ' ';
    else if (b >= 0x20 && b < 0x7F) text += static_cast<char>(b);
  }
  size_t end = text.find_last_not_of(' ');
  return end == std::string::npos ? "" : text.substr(0, end + 1);
}
} // namespace

bool VideoSource::looks_like_capture_denial(const std::string& text) {
  static const char* const DENIAL_MARKERS[] = {
    "permission",
    "denied",
    "secure",
    "not allowed",
    "unable to get output buffers",
    "protected content",
  };
  std::string lower = to_lower(text);
  for (const char* marker : DENIAL_MARKERS) {
    if (lower.find(marker) != std::string::npos) return true;
  }
  return false;
}

Result<std::unique_ptr<VideoSource>> VideoSource::start(SharedLink& link, const std::string& device_id,
                                                        const VideoOptions& options) {
  auto stream = link.open(device_id, ChannelKind::Video, options);
  if (stream.is_err()) {
    SLOG_ERROR("video", "Video channel open failed for %s: %s", device_id.c_str(),
               stream.error().message.c_str());
    return stream.error();
  }

  std::unique_ptr<VideoSource> source(new VideoSource(std::move(stream).value()));
  auto primed = source->prime();
  if (primed.is_err()) {
    source->stop();
    return primed.error();
  }

  SLOG_INFO("video", "Capture started on %s (%dx%d @ %d bps)", device_id.c_str(),
            options.width, options.height, options.bit_rate);
  return Result<std::unique_ptr<VideoSource>>(std::move(source));
}

VideoSource::VideoSource(std::unique_ptr<Stream> stream)
  : stream_(std::move(stream)), read_buf_(READ_CHUNK) {}

VideoSource::~VideoSource() {
  stop();
}

void VideoSource::stop() {
  if (stopped_.exchange(true)) return;
  stream_->close();
  SLOG_DEBUG("video", "Video source stopped after %llu units", (unsigned long long)next_seq_.load());
}

Result<void> VideoSource::prime() {
  std::vector<uint8_t> head;
  bool eof = false;

  while (head.size() < 4) {
    auto r = stream_->readChunk(read_buf_.data(), read_buf_.size());
    if (r.is_err()) return r.error();
    if (r.value() == 0) { eof = true; break; }
    head.insert(head.end(), read_buf_.begin(), read_buf_.begin() + static_cast<std::ptrdiff_t>(r.value()));
  }

  if (head.size() >= 4 && AnnexBSplitter::find_start_code(head.data(), head.size(), 0) == 0) {
    bytes_received_ += head.size();
    std::vector<std::vector<uint8_t>> units;
    splitter_.push(head.data(), head.size(), units);
    for (auto& u : units) pending_.push_back(std::move(u));
    return {};
  }

  // Not video: the recorder is talking. Collect its message.
  while (!eof && head.size() < MAX_DIAGNOSTIC_BYTES) {
    auto r = stream_->readChunk(read_buf_.data(), read_buf_.size());
    if (r.is_err() || r.value() == 0) break;
    head.insert(head.end(), read_buf_.begin(), read_buf_.begin() + static_cast<std::ptrdiff_t>(r.value()));
  }

  std::string text = printable(head);
  if (head.empty()) {
    return Error(ErrorKind::Connection, "video stream closed before any data");
  }
  if (looks_like_capture_denial(text)) {
    SLOG_ERROR("video", "Capture denied by device: %s", text.c_str());
    return Error(ErrorKind::CaptureUnavailable, "screen capture denied: " + text);
  }
  SLOG_ERROR("video", "Recorder did not produce H.264: %s", text.c_str());
  return Error(ErrorKind::Connection, "unexpected recorder output: " + text);
}

bool VideoSource::fill() {
  auto r = stream_->readChunk(read_buf_.data(), read_buf_.size());
  if (r.is_err()) {
    if (!stopped_.load()) {
      SLOG_WARN("video", "Video read failed: %s", r.error().message.c_str());
      read_error_ = r.error();
    }
    return false;
  }

  std::vector<std::vector<uint8_t>> units;
  if (r.value() == 0) {
    splitter_.flush(units);
    for (auto& u : units) pending_.push_back(std::move(u));
    if (!stopped_.load()) SLOG_INFO("video", "Video stream ended (%llu bytes)", (unsigned long long)bytes_received_.load());
    return false;
  }

  bytes_received_ += r.value();
  splitter_.push(read_buf_.data(), r.value(), units);
  for (auto& u : units) pending_.push_back(std::move(u));
  return true;
}

Result<std::optional<AccessUnit>> VideoSource::next() {
  if (ended_.load()) return std::optional<AccessUnit>{};
  if (stopped_.load()) {
    ended_ = true;
    return std::optional<AccessUnit>{};
  }

  while (pending_.empty() && !source_done_) {
    if (!fill()) source_done_ = true;
  }

  if (pending_.empty() || stopped_.load()) {
    ended_ = true;
    if (read_error_) {
      Error e = *read_error_;
      read_error_.reset();
      return e;
    }
    return std::optional<AccessUnit>{};
  }

  AccessUnit unit;
  unit.data = std::move(pending_.front());
  pending_.pop_front();
  unit.seq = next_seq_++;
  return std::optional<AccessUnit>(std::move(unit));
}

} // namespace scry::video
