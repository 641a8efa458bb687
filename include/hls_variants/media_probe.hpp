/**
 * @file media_probe.hpp
 * @brief Source metadata via libavformat
 *
 * @details Opens the container and reads stream info so the pipeline can
 *          log what it is about to segment and tell how long the source is.
 *          Nothing is decoded.
 */

#ifndef HLS_VARIANTS_MEDIA_PROBE_HPP
#define HLS_VARIANTS_MEDIA_PROBE_HPP

extern "C" {
#include <libavformat/avformat.h>
}

#include <string>

namespace hls_variants {

/**
 * @class MediaProbe
 * @brief Owns an AVFormatContext for one source file.
 *
 * @attention
 * `THREAD MODEL`:
 *
 *            - One instance per call; FFmpeg format contexts are not shared
 *              between threads.
 */
class MediaProbe {
  AVFormatContext *fmt_ctx = nullptr;
  int video_stream_idx = -1;
  int audio_stream_idx = -1;

public:
  MediaProbe() = default;
  ~MediaProbe();

  /// Disable copy (FFmpeg contexts are not copyable)
  MediaProbe(const MediaProbe &) = delete;
  MediaProbe &operator=(const MediaProbe &) = delete;

  /**
   * @brief Open the file and read stream info.
   * @param path Source file
   * @param error Output: libav error text on failure
   * @return true on success
   */
  bool open(const std::string &path, std::string &error);

  /**
   * @brief Container duration in seconds, negative when unknown.
   */
  double get_duration() const;

  bool has_video() const { return video_stream_idx >= 0; }
  bool has_audio() const { return audio_stream_idx >= 0; }

  /**
   * @brief Short stream summary for logs ("h264 1920x1080, aac").
   */
  std::string describe() const;
};

} // namespace hls_variants

#endif // HLS_VARIANTS_MEDIA_PROBE_HPP
