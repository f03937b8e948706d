// =============================================================================
// Scry - Frame Decoder interface
// =============================================================================
#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "video_types.hpp"
#include "../result.hpp"

namespace scry::video {

/**
 * Turns access units into pictures, one unit at a time.
 * feed() returns nullopt when the unit produced no displayable picture (for
 * example parameter sets only) and ErrorKind::Decode when the unit is
 * malformed. A Decode error leaves the decoder usable for the next unit.
 * Not thread-safe: one feeding thread per decoder.
 */
class FrameDecoder {
public:
  virtual ~FrameDecoder() = default;

  virtual Result<std::optional<DecodedFrame>> feed(const AccessUnit& unit) = 0;
};

using DecoderFactory = std::function<Result<std::unique_ptr<FrameDecoder>>()>;

} // namespace scry::video
