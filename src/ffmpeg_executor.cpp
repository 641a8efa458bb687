/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "hls_variants/ffmpeg_executor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <utility>

extern "C" {
#include <libavutil/log.h>
}

#include <fmt/core.h>

#include "hls_variants/logging.hpp"
#include "hls_variants/media_probe.hpp"

namespace hls_variants {

namespace {

/// Options shared by every invocation
void push_common_args(std::vector<std::string> &args) {
  args.insert(args.end(), {"-nostdin", "-y", "-hide_banner", "-loglevel",
                           "error", "-progress", "pipe:1", "-nostats"});
}

/// Keys ffmpeg writes in each -progress block
bool is_progress_key(const std::string &key) {
  static const char *const keys[] = {
      "frame",      "fps",        "bitrate",     "total_size",
      "out_time_us", "out_time_ms", "out_time",   "dup_frames",
      "drop_frames", "speed",      "progress"};
  for (const char *k : keys) {
    if (key == k)
      return true;
  }
  return key.rfind("stream_", 0) == 0;
}

/// Log every 10%
constexpr int PROGRESS_LOG_STEP = 10;

/// Source length without the logging done by probe_duration()
double source_duration(const std::string &input_path) {
  MediaProbe probe;
  std::string error;
  if (!probe.open(input_path, error))
    return -1.0;
  return probe.get_duration();
}

} // anonymous namespace

// **---- ProgressTracker ----**

ProgressTracker::ProgressTracker(double expected_sec)
    : expected_sec_(expected_sec) {}

bool ProgressTracker::consume(const std::string &line) {
  size_t eq = line.find('=');
  if (eq == std::string::npos || eq == 0)
    return false;
  std::string key = line.substr(0, eq);
  if (!is_progress_key(key))
    return false;
  if (expected_sec_ <= 0)
    return true;

  std::string value = line.substr(eq + 1);
  if (key == "progress") {
    if (value == "end")
      percent_ = 100;
    return true;
  }

  /// out_time_ms carries microseconds too
  if (key != "out_time_us" && key != "out_time_ms")
    return true;

  char *end = nullptr;
  long long us = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str() || *end != '\0' || us < 0)
    return true;

  double done = static_cast<double>(us) / 1e6;
  int pct = static_cast<int>(done / expected_sec_ * 100.0);
  percent_ = std::max(percent_, std::min(pct, 100));
  return true;
}

// **---- FFmpegEngine ----**

FFmpegEngine::FFmpegEngine(std::string ffmpeg_bin, int timeout_sec)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), timeout_sec_(timeout_sec) {
  /// Probing must not spam the console with container warnings
  av_log_set_level(AV_LOG_ERROR);
}

std::vector<std::string>
FFmpegEngine::segment_args(const SegmentRequest &request) const {
  std::vector<std::string> args{ffmpeg_bin_};
  push_common_args(args);

  args.insert(args.end(), {"-i", request.input_path});

  /// Output-side seek: drop everything before the offset
  if (request.seek_offset_sec > 0) {
    args.insert(args.end(), {"-ss", fmt::format("{}", request.seek_offset_sec)});
  }
  if (request.copy_codecs) {
    args.insert(args.end(), {"-codec", "copy"});
  }

  args.insert(args.end(),
              {"-start_number", std::to_string(request.start_number),
               "-hls_time", fmt::format("{}", request.segment_duration_sec)});

  /// 0 = keep every segment in the playlist (VOD, no sliding window)
  if (request.retain_all_segments) {
    args.insert(args.end(), {"-hls_list_size", "0"});
  }

  args.insert(args.end(), {"-hls_segment_filename", request.segment_pattern,
                           "-f", "hls", request.playlist_path});
  return args;
}

std::vector<std::string>
FFmpegEngine::clip_args(const ClipRequest &request) const {
  std::vector<std::string> args{ffmpeg_bin_};
  push_common_args(args);

  args.insert(args.end(),
              {"-i", request.input_path, "-t",
               fmt::format("{}", request.clip_length_sec)});

  // **---- Video ----**
  args.insert(args.end(),
              {"-c:v", request.video_encoder, "-preset", request.preset,
               "-crf", std::to_string(request.crf), "-vf",
               fmt::format("scale={}:{}", request.width, request.height), "-r",
               std::to_string(request.frame_rate), "-b:v",
               fmt::format("{}k", request.video_bitrate_kbps), "-maxrate",
               fmt::format("{}k", request.video_max_rate_kbps), "-bufsize",
               fmt::format("{}k", request.video_buffer_kbps)});

  // **---- Audio ----**
  args.insert(args.end(),
              {"-c:a", request.audio_encoder, "-b:a",
               fmt::format("{}k", request.audio_bitrate_kbps), "-ar",
               std::to_string(request.audio_sample_rate), "-ac",
               std::to_string(request.audio_channels)});

  args.insert(args.end(), {"-f", request.container, request.output_path});
  return args;
}

EngineResult FFmpegEngine::segment(const SegmentRequest &request) {
  double expected = source_duration(request.input_path);
  if (expected > 0)
    expected -= request.seek_offset_sec;
  return execute(segment_args(request), "segment", expected);
}

EngineResult FFmpegEngine::encode_clip(const ClipRequest &request) {
  return execute(clip_args(request), "clip", request.clip_length_sec);
}

double FFmpegEngine::probe_duration(const std::string &input_path) {
  MediaProbe probe;
  std::string error;
  if (!probe.open(input_path, error)) {
    LOG_WARN("Probe failed for {}: {}", input_path, error);
    return -1.0;
  }

  if (!probe.has_video()) {
    LOG_WARN("{} has no video stream", input_path);
  }
  if (!probe.has_audio()) {
    LOG_INFO("{} has no audio stream; lead-in clips will be silent",
             input_path);
  }

  double duration = probe.get_duration();
  std::string length = duration >= 0
                           ? fmt::format("{:.2f}s", duration)
                           : std::string("unknown length");
  LOG_INFO("Source {}: {} ({})",
           std::filesystem::path(input_path).filename().string(), length,
           probe.describe());
  return duration;
}

EngineResult FFmpegEngine::execute(const std::vector<std::string> &argv,
                                   const char *label, double expected_sec) {
  LOG_INFO("FFmpeg {} command: {}", label, format_command(argv));

  ProgressTracker progress(expected_sec);
  int next_log = PROGRESS_LOG_STEP;
  auto on_line = [&](const std::string &line) {
    if (!progress.consume(line))
      return false;
    if (progress.percent() >= next_log) {
      LOG_INFO("FFmpeg {} progress: {}%", label, progress.percent());
      next_log = (progress.percent() / PROGRESS_LOG_STEP + 1) *
                 PROGRESS_LOG_STEP;
    }
    return true;
  };

  auto start = std::chrono::steady_clock::now();
  EngineResult result = run_process(argv, timeout_sec_, on_line);
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  if (!result.ok()) {
    LOG_ERROR("FFmpeg {} failed ({}) after {:.1f}s", label,
              describe_failure(result), elapsed);
  }
  return result;
}

} // namespace hls_variants
