#include "annexb_splitter.hpp"

#include "../scry_log.hpp"

namespace scry::video {

namespace {
constexpr uint8_t NAL_SEI = 6;
constexpr uint8_t NAL_SPS = 7;
constexpr uint8_t NAL_PPS = 8;
constexpr uint8_t NAL_AUD = 9;

size_t start_code_len(const std::vector<uint8_t>& buf) {
  return (buf.size() >= 4 && buf[0] == 0 && buf[1] == 0 && buf[2] == 0 && buf[3] == 1) ? 4 : 3;
}
} // namespace

// Find H.264 Annex B start code (00 00 00 01 or 00 00 01) starting from offset
size_t AnnexBSplitter::find_start_code(const uint8_t* data, size_t len, size_t offset) {
  for (size_t i = offset; i + 3 <= len; i++) {
    if (data[i] == 0 && data[i+1] == 0) {
      if (i + 3 < len && data[i+2] == 0 && data[i+3] == 1) return i;  // 00 00 00 01
      if (data[i+2] == 1) return i;  // 00 00 01
    }
  }
  return (size_t)-1;
}

// first_mb_in_slice is ue(v) right after the NAL header; ue 0 is the single bit '1'
bool AnnexBSplitter::starts_picture(const uint8_t* nal, size_t len) {
  return len >= 2 && (nal[1] & 0x80) != 0;
}

void AnnexBSplitter::push(const uint8_t* data, size_t len, std::vector<std::vector<uint8_t>>& out) {
  buf_.insert(buf_.end(), data, data + len);

  while (buf_.size() >= 4) {
    if (scan_pos_ == 0 && !header_seen_) {
      size_t first_sc = find_start_code(buf_.data(), buf_.size(), 0);
      if (first_sc == (size_t)-1) {
        // Keep a possible partial start code, drop the rest
        size_t drop = buf_.size() - 3;
        bytes_discarded_ += drop;
        buf_.erase(buf_.begin(), buf_.begin() + drop);
        return;
      }
      if (first_sc > 0) {
        bytes_discarded_ += first_sc;
        buf_.erase(buf_.begin(), buf_.begin() + first_sc);
      }
    }

    size_t sc_len = start_code_len(buf_);
    if (!header_seen_) {
      // Type byte, plus the first slice data byte for VCL NALs
      if (buf_.size() <= sc_len) return;
      size_t need = is_vcl(buf_[sc_len] & 0x1F) ? 2 : 1;
      if (buf_.size() < sc_len + need) return;
      on_nal_header(buf_.data() + sc_len, buf_.size() - sc_len, out);
      header_seen_ = true;
    }

    size_t from = scan_pos_ > sc_len ? scan_pos_ : sc_len;
    size_t next_sc = find_start_code(buf_.data(), buf_.size(), from);
    if (next_sc == (size_t)-1) {
      // NAL is incomplete; rescan only the tail next time
      scan_pos_ = buf_.size() >= 3 ? buf_.size() - 3 : 0;
      if (scan_pos_ < sc_len) scan_pos_ = sc_len;
      return;
    }

    unit_.insert(unit_.end(), buf_.begin(), buf_.begin() + next_sc);
    buf_.erase(buf_.begin(), buf_.begin() + next_sc);
    scan_pos_ = 0;
    header_seen_ = false;
  }
}

void AnnexBSplitter::flush(std::vector<std::vector<uint8_t>>& out) {
  if (!buf_.empty() && find_start_code(buf_.data(), buf_.size(), 0) == 0) {
    size_t sc_len = start_code_len(buf_);
    if (buf_.size() > sc_len) {
      if (!header_seen_) on_nal_header(buf_.data() + sc_len, buf_.size() - sc_len, out);
      unit_.insert(unit_.end(), buf_.begin(), buf_.end());
    }
  } else if (!buf_.empty()) {
    bytes_discarded_ += buf_.size();
  }
  buf_.clear();
  scan_pos_ = 0;
  header_seen_ = false;

  if (!unit_.empty()) out.push_back(std::move(unit_));
  unit_.clear();
  unit_has_vcl_ = false;
}

void AnnexBSplitter::on_nal_header(const uint8_t* nal, size_t avail,
                                   std::vector<std::vector<uint8_t>>& out) {
  uint8_t nal_type = nal[0] & 0x1F;
  nals_seen_++;

  if (nals_seen_ <= 5) {
    SLOG_DEBUG("annexb", "NAL #%llu type=%u", (unsigned long long)nals_seen_, nal_type);
  }

  bool boundary = unit_has_vcl_ &&
      (nal_type == NAL_SEI || nal_type == NAL_SPS || nal_type == NAL_PPS || nal_type == NAL_AUD ||
       (is_vcl(nal_type) && starts_picture(nal, avail)));
  if (boundary) {
    out.push_back(std::move(unit_));
    unit_.clear();
    unit_has_vcl_ = false;
  }

  // The NAL's bytes join unit_ once its end is known
  if (is_vcl(nal_type)) unit_has_vcl_ = true;
}

} // namespace scry::video
