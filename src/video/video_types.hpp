// =============================================================================
// Scry - Video pipeline data types
// =============================================================================
#pragma once

#include <cstdint>
#include <vector>

namespace scry::video {

// One complete picture worth of Annex-B NAL units (start codes included).
// seq counts from 0 per VideoSource and never repeats.
struct AccessUnit {
  std::vector<uint8_t> data;
  uint64_t seq = 0;
};

// Tightly packed RGBA (width * height * 4 bytes)
struct DecodedFrame {
  std::vector<uint8_t> rgba;
  int width = 0;
  int height = 0;
  uint64_t index = 0;
};

} // namespace scry::video
