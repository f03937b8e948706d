#include "h264_decoder.hpp"

#include <cstring>

#include "annexb_splitter.hpp"
#include "../scry_log.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace scry::video {

H264Decoder::H264Decoder() = default;

H264Decoder::~H264Decoder() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_rgba_) {
    av_frame_free(&frame_rgba_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
}

bool H264Decoder::init() {
  const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_H264);
  if (!codec) {
    SLOG_ERROR("h264", "FFmpeg has no H.264 decoder");
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    return false;
  }

  // Low latency settings: one picture in, one picture out
  codec_ctx_->flags |= AV_CODEC_FLAG_LOW_DELAY;
  codec_ctx_->delay = 0;
  codec_ctx_->thread_count = 1;
  codec_ctx_->thread_type = 0;
  codec_ctx_->has_b_frames = 0;

  if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
    SLOG_ERROR("h264", "avcodec_open2 failed");
    avcodec_free_context(&codec_ctx_);
    return false;
  }

  frame_ = av_frame_alloc();
  frame_rgba_ = av_frame_alloc();
  packet_ = av_packet_alloc();

  if (!frame_ || !frame_rgba_ || !packet_) {
    // Cleanup partially allocated resources
    if (packet_) { av_packet_free(&packet_); }
    if (frame_rgba_) { av_frame_free(&frame_rgba_); }
    if (frame_) { av_frame_free(&frame_); }
    avcodec_free_context(&codec_ctx_);
    return false;
  }

  SLOG_INFO("h264", "Decoder ready (CPU, low delay)");
  return true;
}

Result<std::unique_ptr<FrameDecoder>> H264Decoder::create() {
  auto decoder = std::make_unique<H264Decoder>();
  if (!decoder->init()) {
    return Error(ErrorKind::Decode, "H.264 decoder initialization failed");
  }
  std::unique_ptr<FrameDecoder> base = std::move(decoder);
  return Result<std::unique_ptr<FrameDecoder>>(std::move(base));
}

bool H264Decoder::is_well_formed(const uint8_t* data, size_t len, const char** why) {
  size_t pos = AnnexBSplitter::find_start_code(data, len, 0);
  if (pos != 0) {
    if (why) *why = "no start code";
    return false;
  }
  while (pos != (size_t)-1) {
    size_t sc_len = (pos + 3 < len && data[pos + 2] == 0) ? 4 : 3;
    size_t nal = pos + sc_len;
    if (nal >= len) break;  // trailing start code
    if (data[nal] & 0x80) {
      if (why) *why = "forbidden_zero_bit set";
      return false;
    }
    pos = AnnexBSplitter::find_start_code(data, len, nal);
  }
  return true;
}

Result<std::optional<DecodedFrame>> H264Decoder::feed(const AccessUnit& unit) {
  if (!codec_ctx_) {
    return Error(ErrorKind::Decode, "decoder not initialized");
  }

  units_fed_++;

  const char* why = nullptr;
  if (!is_well_formed(unit.data.data(), unit.data.size(), &why)) {
    error_count_++;
    SLOG_WARN("h264", "Rejected unit #%llu: %s", (unsigned long long)unit.seq, why);
    return Error(ErrorKind::Decode, std::string("malformed access unit: ") + why);
  }

  // Feed data to decoder
  packet_->data = const_cast<uint8_t*>(unit.data.data());
  packet_->size = static_cast<int>(unit.data.size());

  int ret = avcodec_send_packet(codec_ctx_, packet_);
  packet_->data = nullptr;
  packet_->size = 0;
  if (ret < 0 && ret != AVERROR(EAGAIN)) {
    send_packet_errors_++;
    error_count_++;
    // Log errors with throttling (per-instance counter)
    if (send_packet_errors_ <= 20 || send_packet_errors_ % 100 == 0) {
      SLOG_ERROR("h264", "send_packet error: %d (total: %llu)", ret, (unsigned long long)send_packet_errors_);
    }
    return Error(ErrorKind::Decode, "avcodec_send_packet failed", ret);
  }

  std::optional<DecodedFrame> latest;
  while (true) {
    ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      break;
    }
    if (ret < 0) {
      receive_frame_errors_++;
      error_count_++;
      if (receive_frame_errors_ <= 10 || receive_frame_errors_ % 100 == 0) {
        SLOG_ERROR("h264", "receive_frame error: %d (total: %llu)", ret, (unsigned long long)receive_frame_errors_);
      }
      return Error(ErrorKind::Decode, "avcodec_receive_frame failed", ret);
    }

    if (frame_->flags & AV_FRAME_FLAG_CORRUPT) {
      corrupt_dropped_++;
      if (corrupt_dropped_ <= 10 || corrupt_dropped_ % 100 == 0) {
        SLOG_WARN("h264", "Dropped corrupt picture (total: %llu)", (unsigned long long)corrupt_dropped_);
      }
      av_frame_unref(frame_);
      continue;
    }

    DecodedFrame out;
    bool ok = convert_frame_to_rgba(frame_, out);
    av_frame_unref(frame_);
    if (!ok) {
      return Error(ErrorKind::Decode, "RGBA conversion failed");
    }

    out.index = frames_decoded_++;
    if (frames_decoded_ <= 5 || frames_decoded_ % 100 == 0) {
      SLOG_INFO("h264", "DECODED FRAME #%llu: %dx%d", (unsigned long long)frames_decoded_, out.width, out.height);
    }
    // More than one picture per unit: only the newest is worth showing
    latest = std::move(out);
  }

  return Result<std::optional<DecodedFrame>>(std::move(latest));
}

bool H264Decoder::convert_frame_to_rgba(AVFrame* frame, DecodedFrame& out) {
  int width = frame->width;
  int height = frame->height;

  // Sanity check dimensions
  if (width <= 0 || height <= 0 || width > 8192 || height > 8192) {
    SLOG_ERROR("h264", "Invalid frame dimensions: %dx%d", width, height);
    error_count_++;
    return false;
  }

  // Reinitialize SwsContext if dimensions or format changed
  if (width != last_width_ || height != last_height_ || frame->format != last_format_ || !sws_ctx_) {
    if (sws_ctx_) {
      sws_freeContext(sws_ctx_);
      sws_ctx_ = nullptr;
    }

    sws_ctx_ = sws_getContext(
      width, height, (AVPixelFormat)frame->format,
      width, height, AV_PIX_FMT_RGBA,
      SWS_FAST_BILINEAR, nullptr, nullptr, nullptr
    );

    if (!sws_ctx_) {
      SLOG_ERROR("h264", "Failed to create SwsContext for %dx%d fmt=%d -> RGBA",
                 width, height, (int)frame->format);
      error_count_++;
      return false;
    }

    // Allocate RGBA frame buffer
    av_frame_unref(frame_rgba_);
    frame_rgba_->format = AV_PIX_FMT_RGBA;
    frame_rgba_->width = width;
    frame_rgba_->height = height;
    if (av_frame_get_buffer(frame_rgba_, 32) < 0) {
      SLOG_ERROR("h264", "Failed to allocate RGBA frame buffer");
      error_count_++;
      av_frame_unref(frame_rgba_);
      sws_freeContext(sws_ctx_);
      sws_ctx_ = nullptr;
      last_width_ = 0;
      last_height_ = 0;
      return false;
    }

    SLOG_INFO("h264", "Stream geometry %dx%d fmt=%d", width, height, (int)frame->format);
    last_width_ = width;
    last_height_ = height;
    last_format_ = frame->format;
  }

  int result = sws_scale(sws_ctx_,
    frame->data, frame->linesize,
    0, height,
    frame_rgba_->data, frame_rgba_->linesize
  );

  if (result != height) {
    SLOG_WARN("h264", "sws_scale returned unexpected value: %d (expected %d)", result, height);
    error_count_++;
    return false;
  }

  // linesize might have padding: copy row by row into the packed buffer
  const size_t row_bytes = static_cast<size_t>(width) * 4;
  out.width = width;
  out.height = height;
  out.rgba.resize(row_bytes * static_cast<size_t>(height));
  if (frame_rgba_->linesize[0] == static_cast<int>(row_bytes)) {
    memcpy(out.rgba.data(), frame_rgba_->data[0], out.rgba.size());
  } else {
    uint8_t* dst = out.rgba.data();
    const uint8_t* src = frame_rgba_->data[0];
    for (int y = 0; y < height; y++) {
      memcpy(dst, src, row_bytes);
      dst += row_bytes;
      src += frame_rgba_->linesize[0];
    }
  }
  return true;
}

} // namespace scry::video
