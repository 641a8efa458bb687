/**
 * @file transcode_engine.hpp
 * @brief Narrow interface to the external transcoding engine
 *
 * @details The pipeline only ever issues two kinds of requests:
 *
 *          - SegmentRequest: cut the source into HLS segments, normally by
 *            codec copy
 *
 *          - ClipRequest: re-encode a short clip from the start of the
 *            source into a single degraded file
 *
 *          Every call blocks until the engine process has exited.
 */

#ifndef HLS_VARIANTS_TRANSCODE_ENGINE_HPP
#define HLS_VARIANTS_TRANSCODE_ENGINE_HPP

#include <string>

#include "process_runner.hpp"
#include "types.hpp"

namespace hls_variants {

/// Engine outcome: exit status plus diagnostic text
using EngineResult = ProcessResult;

/**
 * @struct SegmentRequest
 * @brief "Segment losslessly" request.
 */
struct SegmentRequest {
  std::string input_path;
  double segment_duration_sec = 0;
  std::string playlist_path;   //< Playlist written by the engine
  std::string segment_pattern; //< printf-style segment file pattern
  int start_number = 0;        //< Index of the first segment file
  bool copy_codecs = true;     //< No re-encode
  bool retain_all_segments = true; //< VOD list, no sliding window
  double seek_offset_sec = 0;      //< Skip this much of the source (0 = none)
};

/**
 * @struct ClipRequest
 * @brief "Degrade and encode a fixed-length clip" request.
 */
struct ClipRequest {
  std::string input_path;
  double clip_length_sec = 0;

  int width = 0;
  int height = 0;
  int frame_rate = 0;
  int video_bitrate_kbps = 0;
  int video_max_rate_kbps = 0;
  int video_buffer_kbps = 0;
  std::string video_encoder;
  std::string preset;
  int crf = 0;

  std::string audio_encoder;
  int audio_bitrate_kbps = 0;
  int audio_sample_rate = 0;
  int audio_channels = 0;

  std::string container;
  std::string output_path;
};

/**
 * @class TranscodeEngine
 * @brief Black-box engine driven by the segmenters.
 * @note Implementations must be safe to call from several pipeline workers
 *       at once.
 */
class TranscodeEngine {
public:
  virtual ~TranscodeEngine() = default;

  virtual EngineResult segment(const SegmentRequest &request) = 0;

  virtual EngineResult encode_clip(const ClipRequest &request) = 0;

  /**
   * @brief Duration of the source in seconds.
   * @return Duration, or a negative value when it cannot be determined
   */
  virtual double probe_duration(const std::string &input_path) = 0;
};

/**
 * @brief Convert a failed engine result into a variant error.
 * @param result Engine outcome (must not be ok())
 * @param step Name of the build step that issued the request
 */
VariantError engine_error(const EngineResult &result, const std::string &step);

} // namespace hls_variants

#endif // HLS_VARIANTS_TRANSCODE_ENGINE_HPP
