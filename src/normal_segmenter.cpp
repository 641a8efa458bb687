/**
 * @file normal_segmenter.cpp
 * @brief Codec-copy rendition builder implementation
 */

#include "hls_variants/normal_segmenter.hpp"

#include <fmt/core.h>

#include "hls_variants/logging.hpp"
#include "hls_variants/media_playlist.hpp"
#include "hls_variants/system.hpp"

namespace hls_variants {

bool prepare_output_dir(const VariantPaths &paths, VariantError &error) {
  std::string detail;
  if (!ensure_directory(paths.output_dir, detail) ||
      !remove_if_exists(paths.staging_playlist_path, detail) ||
      !remove_if_exists(paths.playlist_path + ".tmp", detail)) {
    error = {ErrorKind::Filesystem, "prepare", detail};
    return false;
  }
  return true;
}

bool build_normal_variant(TranscodeEngine &engine, const VideoAsset &asset,
                          const VariantSpec &spec, const VariantPaths &paths,
                          VariantError &error) {
  LOG_INFO("Creating m3u8 with {}s segments for {}...",
           spec.segment_duration_sec, asset.file_name);

  if (!prepare_output_dir(paths, error))
    return false;

  // **---- Engine pass ----**

  SegmentRequest request;
  request.input_path = asset.path;
  request.segment_duration_sec = spec.segment_duration_sec;
  request.playlist_path = paths.staging_playlist_path;
  request.segment_pattern = paths.segment_pattern;
  request.start_number = 0;
  request.copy_codecs = true;
  request.retain_all_segments = true;

  EngineResult result = engine.segment(request);
  if (!result.ok()) {
    error = engine_error(result, "segment");
    return false;
  }

  // **---- Validate and publish ----**

  std::string text;
  std::string detail;
  if (!read_text_file(paths.staging_playlist_path, text, detail)) {
    error = {ErrorKind::PlaylistSynthesis, "validate", detail};
    return false;
  }

  MediaPlaylist playlist;
  if (!parse_media_playlist(text, ParseMode::Lenient, playlist, detail)) {
    error = {ErrorKind::PlaylistSynthesis, "validate",
             fmt::format("engine playlist rejected: {}", detail)};
    return false;
  }
  if (playlist.segments.empty()) {
    error = {ErrorKind::PlaylistSynthesis, "validate",
             "engine playlist lists no segments"};
    return false;
  }

  auto missing = missing_segment_files(playlist, paths.output_dir);
  if (!missing.empty()) {
    error = {ErrorKind::PlaylistSynthesis, "validate",
             fmt::format("{} listed segment(s) missing, first: {}",
                         missing.size(), missing.front())};
    return false;
  }

  /// The engine has exited, so the staging file is complete
  if (!publish_file(paths.staging_playlist_path, paths.playlist_path,
                    detail)) {
    error = {ErrorKind::Filesystem, "publish", detail};
    return false;
  }

  LOG_SUCCESS("Finished creating m3u8 with {}s segments ({} segments)",
              spec.segment_duration_sec, playlist.segments.size());
  return true;
}

} // namespace hls_variants
