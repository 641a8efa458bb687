/**
 * @file ffmpeg_executor.hpp
 * @brief TranscodeEngine backed by the ffmpeg command-line tool
 *
 * @details Translates engine requests into ffmpeg argument lists and runs
 *          them through run_process(). Every invocation:
 *
 *          - Runs with `-nostdin -y -hide_banner -loglevel error`, so only
 *            real errors reach the captured diagnostics
 *
 *          - Reports progress through `-progress pipe:1`; the key=value
 *            lines are turned into percentage logs and kept out of the
 *            diagnostics
 *
 *          - Is logged as a full command line before it starts
 *
 *          - Is bounded by the configured timeout
 *
 *          Duration probing uses libavformat directly instead of ffprobe.
 */

#ifndef HLS_VARIANTS_FFMPEG_EXECUTOR_HPP
#define HLS_VARIANTS_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "transcode_engine.hpp"

namespace hls_variants {

/**
 * @class ProgressTracker
 * @brief Follows ffmpeg's `-progress` key=value stream for one invocation.
 */
class ProgressTracker {
public:
  /// @param expected_sec Output length the run should reach (<= 0 = unknown)
  explicit ProgressTracker(double expected_sec);

  /**
   * @brief Feed one output line.
   * @return true if the line belongs to the progress stream
   */
  bool consume(const std::string &line);

  /// Percentage reached, 0-100; -1 while unknown
  int percent() const { return percent_; }

private:
  double expected_sec_;
  int percent_ = -1;
};

/**
 * @class FFmpegEngine
 * @brief Stateless ffmpeg driver; safe to share between workers.
 */
class FFmpegEngine : public TranscodeEngine {
public:
  /**
   * @param ffmpeg_bin Executable name or path
   * @param timeout_sec Per-invocation time limit (0 = none)
   */
  FFmpegEngine(std::string ffmpeg_bin, int timeout_sec);

  EngineResult segment(const SegmentRequest &request) override;
  EngineResult encode_clip(const ClipRequest &request) override;
  double probe_duration(const std::string &input_path) override;

  /// Argument list for a segment request (argv[0] is the binary)
  std::vector<std::string> segment_args(const SegmentRequest &request) const;

  /// Argument list for a clip request (argv[0] is the binary)
  std::vector<std::string> clip_args(const ClipRequest &request) const;

private:
  EngineResult execute(const std::vector<std::string> &argv,
                       const char *label, double expected_sec);

  std::string ffmpeg_bin_;
  int timeout_sec_;
};

} // namespace hls_variants

#endif // HLS_VARIANTS_FFMPEG_EXECUTOR_HPP
