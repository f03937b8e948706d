#include "decode_pump.hpp"

#include "../scry_log.hpp"

namespace scry::video {

DecodePump::DecodePump(VideoSource& source, FrameDecoder& decoder, FrameSlot& slot,
                       int max_consecutive_errors)
  : source_(source), decoder_(decoder), slot_(slot),
    max_consecutive_errors_(max_consecutive_errors > 0 ? max_consecutive_errors : 1) {}

Result<DecodePump::Step> DecodePump::step() {
  auto next = source_.next();
  if (next.is_err()) return next.error();
  if (!next.value()) return Step::EndOfStream;

  const AccessUnit& unit = *next.value();
  units_++;

  auto decoded = decoder_.feed(unit);
  if (decoded.is_err()) {
    consecutive_errors_++;
    dropped_units_++;
    if (consecutive_errors_ >= max_consecutive_errors_) {
      SLOG_ERROR("decode", "%d consecutive decode errors, giving up (last: %s)",
                 consecutive_errors_, decoded.error().message.c_str());
      return Error(ErrorKind::Decode,
                   std::to_string(consecutive_errors_) + " consecutive decode errors: " +
                   decoded.error().message);
    }
    // Throttle: first few, then every 100th
    uint64_t dropped = dropped_units_.load();
    if (dropped <= 10 || dropped % 100 == 0) {
      SLOG_WARN("decode", "Dropped unit #%llu: %s (%d in a row)", (unsigned long long)unit.seq,
                decoded.error().message.c_str(), consecutive_errors_);
    }
    return Step::Dropped;
  }

  consecutive_errors_ = 0;
  if (!decoded.value()) return Step::NoFrame;

  slot_.publish(std::move(*decoded.value()));
  frames_++;
  return Step::Frame;
}

Result<DecodePump::Exit> DecodePump::run() {
  SLOG_INFO("decode", "Decode loop started");
  while (!stop_requested_.load()) {
    auto r = step();
    if (r.is_err()) return r.error();
    if (r.value() == Step::EndOfStream) {
      SLOG_INFO("decode", "Decode loop finished: %llu units, %llu frames, %llu dropped",
                (unsigned long long)units_.load(), (unsigned long long)frames_.load(),
                (unsigned long long)dropped_units_.load());
      return stop_requested_.load() ? Exit::Stopped : Exit::EndOfStream;
    }
  }
  return Exit::Stopped;
}

} // namespace scry::video
