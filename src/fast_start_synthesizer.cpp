/**
 * @file fast_start_synthesizer.cpp
 * @brief Fast-start rendition builder implementation
 */

#include "hls_variants/fast_start_synthesizer.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "hls_variants/config.hpp"
#include "hls_variants/logging.hpp"
#include "hls_variants/normal_segmenter.hpp"
#include "hls_variants/system.hpp"
#include "hls_variants/variant_catalog.hpp"

namespace hls_variants {

namespace fs = std::filesystem;

ClipRequest lead_in_request(const VideoAsset &asset, const VariantSpec &spec,
                            const VariantPaths &paths) {
  ClipRequest request;
  request.input_path = asset.path;
  request.clip_length_sec = spec.segment_duration_sec;

  request.width = Config::lead_in_width();
  request.height = Config::lead_in_height();
  request.frame_rate = Config::lead_in_fps();
  request.video_bitrate_kbps = Config::lead_in_video_kbps();
  request.video_max_rate_kbps = Config::lead_in_video_kbps();
  request.video_buffer_kbps = 2 * Config::lead_in_video_kbps();
  request.video_encoder = "libx264";
  request.preset = "ultrafast";
  request.crf = 51; //< Worst quality x264 allows

  request.audio_encoder = "aac";
  request.audio_bitrate_kbps = Config::lead_in_audio_kbps();
  request.audio_sample_rate = Config::lead_in_sample_rate();
  request.audio_channels = 1;

  request.container = "mpegts";
  request.output_path = paths.lead_in_segment_path;
  return request;
}

bool synthesize_fast_start_playlist(const MediaPlaylist &remainder,
                                    const VariantSpec &spec,
                                    MediaPlaylist &playlist,
                                    std::string &error) {
  playlist = MediaPlaylist{};
  playlist.version = 3;
  playlist.target_duration = target_duration(spec);
  playlist.media_sequence = 0;

  MediaSegment lead_in;
  lead_in.duration = spec.segment_duration_sec;
  lead_in.uri = segment_file_name(0);
  playlist.segments.push_back(lead_in);

  /// Index 0 belongs to the lead-in; the remainder must continue at 1
  /// without gaps or repeats.
  int expected = 1;
  for (const auto &seg : remainder.segments) {
    std::string want = segment_file_name(expected);
    if (seg.uri != want) {
      error = fmt::format("remainder segment {} is '{}', expected '{}'",
                          expected, seg.uri, want);
      return false;
    }
    playlist.segments.push_back(seg);
    ++expected;
  }

  playlist.end_list = true;
  return true;
}

bool build_fast_start_variant(TranscodeEngine &engine, const VideoAsset &asset,
                              const VariantSpec &spec,
                              const VariantPaths &paths, VariantError &error) {
  LOG_INFO("Creating m3u8 with FAST START - {}s segments for {}...",
           spec.segment_duration_sec, asset.file_name);

  // **----- STEP 1: OUTPUT DIRECTORY -----**

  if (!prepare_output_dir(paths, error))
    return false;

  // **----- STEP 2: DEGRADED LEAD-IN -----**

  LOG_INFO("Creating low quality first segment...");
  EngineResult result = engine.encode_clip(lead_in_request(asset, spec, paths));
  if (!result.ok()) {
    error = engine_error(result, "lead-in");
    return false;
  }

  std::error_code ec;
  auto lead_in_size = fs::file_size(paths.lead_in_segment_path, ec);
  if (ec || lead_in_size == 0) {
    error = {ErrorKind::Encode, "lead-in",
             fmt::format("engine reported success but {} is missing or empty",
                         paths.lead_in_segment_path)};
    return false;
  }
  LOG_INFO("Low quality first segment created ({} bytes)", lead_in_size);

  // **----- STEP 3: CODEC-COPY REMAINDER -----**

  MediaPlaylist remainder;
  remainder.end_list = true;

  double source_duration = engine.probe_duration(asset.path);
  if (source_duration >= 0 && source_duration <= spec.segment_duration_sec) {
    LOG_WARN("{} is only {:.2f}s long; playlist holds the lead-in alone",
             asset.file_name, source_duration);
  } else {
    LOG_INFO("Creating normal quality segments (starting from second "
             "segment)...");

    SegmentRequest request;
    request.input_path = asset.path;
    request.segment_duration_sec = spec.segment_duration_sec;
    request.playlist_path = paths.staging_playlist_path;
    request.segment_pattern = paths.segment_pattern;
    request.start_number = 1;
    request.copy_codecs = true;
    request.retain_all_segments = true;
    request.seek_offset_sec = spec.segment_duration_sec;

    result = engine.segment(request);
    if (!result.ok()) {
      error = engine_error(result, "remainder");
      return false;
    }

    // **----- STEP 4a: PARSE REMAINDER -----**

    std::string text;
    std::string detail;
    if (!read_text_file(paths.staging_playlist_path, text, detail)) {
      error = {ErrorKind::PlaylistSynthesis, "synthesis", detail};
      return false;
    }
    if (!parse_media_playlist(text, ParseMode::Strict, remainder, detail)) {
      error = {ErrorKind::PlaylistSynthesis, "synthesis",
               fmt::format("remainder playlist rejected: {}", detail)};
      return false;
    }
  }

  // **----- STEP 4b: SPLICE -----**

  MediaPlaylist playlist;
  std::string detail;
  if (!synthesize_fast_start_playlist(remainder, spec, playlist, detail)) {
    error = {ErrorKind::PlaylistSynthesis, "synthesis", detail};
    return false;
  }

  auto missing = missing_segment_files(playlist, paths.output_dir);
  if (!missing.empty()) {
    error = {ErrorKind::PlaylistSynthesis, "synthesis",
             fmt::format("{} listed segment(s) missing, first: {}",
                         missing.size(), missing.front())};
    return false;
  }

  // **----- STEP 5: PUBLISH -----**

  if (!write_file_atomic(paths.playlist_path,
                         serialize_media_playlist(playlist), detail)) {
    error = {ErrorKind::Filesystem, "publish", detail};
    return false;
  }

  /// Published; a leftover staging file is only clutter
  if (!remove_if_exists(paths.staging_playlist_path, detail)) {
    LOG_WARN("{}", detail);
  }

  LOG_SUCCESS("Finished creating m3u8 with FAST START ({}s segments, {} "
              "segments)",
              spec.segment_duration_sec, playlist.segments.size());
  return true;
}

} // namespace hls_variants
