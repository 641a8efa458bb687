/**
 * @file media_probe.cpp
 * @brief libavformat-based source probing
 */

#include "hls_variants/media_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

namespace hls_variants {

namespace {

std::string av_error_text(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

MediaProbe::~MediaProbe() {
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
}

bool MediaProbe::open(const std::string &path, std::string &error) {
  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    /// avformat_open_input frees the context on failure
    fmt_ctx = nullptr;
    error = fmt::format("avformat_open_input failed: {}", av_error_text(ret));
    return false;
  }

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    error =
        fmt::format("avformat_find_stream_info failed: {}", av_error_text(ret));
    return false;
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  audio_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  return true;
}

double MediaProbe::get_duration() const {
  if (!fmt_ctx || fmt_ctx->duration == AV_NOPTS_VALUE)
    return -1.0;
  return static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
}

std::string MediaProbe::describe() const {
  if (!fmt_ctx)
    return "unknown";

  std::string desc;
  if (video_stream_idx >= 0) {
    const AVCodecParameters *par = fmt_ctx->streams[video_stream_idx]->codecpar;
    desc = fmt::format("{} {}x{}", avcodec_get_name(par->codec_id), par->width,
                       par->height);
  }
  if (audio_stream_idx >= 0) {
    const AVCodecParameters *par = fmt_ctx->streams[audio_stream_idx]->codecpar;
    if (!desc.empty())
      desc += ", ";
    desc += avcodec_get_name(par->codec_id);
  }
  return desc.empty() ? "no audio/video streams" : desc;
}

} // namespace hls_variants
