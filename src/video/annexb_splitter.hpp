// =============================================================================
// Scry - Annex-B Access Unit Splitter
// =============================================================================
// Groups a raw H.264 byte stream (00 00 01 / 00 00 00 01 delimited) into
// access units. A new unit begins at an AUD/SPS/PPS/SEI NAL, or at a slice
// with first_mb_in_slice == 0, once the current unit holds a slice. The
// boundary is decided from the next NAL's header bytes, so a unit is released
// as soon as the following one starts.
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace scry::video {

class AnnexBSplitter {
public:
  // Appends stream bytes; every access unit completed by them goes to out.
  void push(const uint8_t* data, size_t len, std::vector<std::vector<uint8_t>>& out);

  // End of stream: emits the trailing NAL and the pending unit.
  void flush(std::vector<std::vector<uint8_t>>& out);

  uint64_t nals_seen() const { return nals_seen_; }
  uint64_t bytes_discarded() const { return bytes_discarded_; }

  // Offset of the next start code at or after offset, or (size_t)-1
  static size_t find_start_code(const uint8_t* data, size_t len, size_t offset);

  // nal points just past the start code
  static bool is_vcl(uint8_t nal_type) { return nal_type == 1 || nal_type == 5; }
  static bool starts_picture(const uint8_t* nal, size_t len);

private:
  // Called once the header of the NAL at the front of buf_ is available
  void on_nal_header(const uint8_t* nal, size_t avail, std::vector<std::vector<uint8_t>>& out);

  std::vector<uint8_t> buf_;
  size_t scan_pos_ = 0;           // resume point for the next start code search
  bool header_seen_ = false;      // on_nal_header ran for the NAL at buf_[0]
  std::vector<uint8_t> unit_;     // access unit under construction
  bool unit_has_vcl_ = false;
  uint64_t nals_seen_ = 0;
  uint64_t bytes_discarded_ = 0;
};

} // namespace scry::video
