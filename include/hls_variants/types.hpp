/**
 * @file types.hpp
 * @brief Core data types and constants for HLS variant generation
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Output layout constants (playlist and segment names)
 *
 *          - VideoAsset for discovered source files
 *
 *          - VariantSpec and VariantPaths for renditions
 *
 *          - VariantError / VariantResult for per-variant outcomes
 */

#ifndef HLS_VARIANTS_TYPES_HPP
#define HLS_VARIANTS_TYPES_HPP

#include <cstddef>
#include <string>

namespace hls_variants {

// **----- CONSTANTS -----**

/// Canonical playlist name. Its presence is the only completion signal.
constexpr const char *PLAYLIST_FILE_NAME = "playlist.m3u8";

/**
 * @brief Playlist name handed to the engine.
 * @note The engine rewrites its playlist after every segment, so it never
 *       writes to the canonical name directly. Hidden so the static layer
 *       does not list it.
 */
constexpr const char *STAGING_PLAYLIST_FILE_NAME = ".engine.m3u8";

/// printf-style segment file pattern understood by the engine
constexpr const char *SEGMENT_FILE_PATTERN = "segment%03d.ts";

/// Number of renditions derived per asset
constexpr size_t VARIANT_COUNT = 10;

// **----- DATA STRUCTURES -----**

/**
 * @struct VideoAsset
 * @brief A source video discovered in the uploads root.
 */
struct VideoAsset {
  std::string path;      //< Full path to the source file
  std::string file_name; //< File name with extension
  std::string base_name; //< File name without extension (output namespace)
};

/**
 * @struct VariantSpec
 * @brief One rendition of the catalog (segment duration x fast-start).
 */
struct VariantSpec {
  double segment_duration_sec; //< Target segment length
  const char *suffix;          //< Output directory suffix ("4s", "4s_fast")
  bool fast_start;             //< Degraded lead-in segment
};

/**
 * @struct VariantPaths
 * @brief Filesystem locations derived for one asset x variant.
 */
struct VariantPaths {
  std::string output_dir;            //< {root}/{base}_{suffix}
  std::string playlist_path;         //< output_dir/playlist.m3u8
  std::string staging_playlist_path; //< output_dir/.engine.m3u8
  std::string segment_pattern;       //< output_dir/segment%03d.ts
  std::string lead_in_segment_path;  //< output_dir/segment000.ts
};

/**
 * @brief Failure categories reported by the pipeline.
 */
enum class ErrorKind {
  None,
  Scan,             //< Uploads root could not be read
  Encode,           //< Engine reported failure
  Timeout,          //< Engine exceeded its time limit and was killed
  PlaylistSynthesis, //< Playlist could not be read, parsed or validated
  Filesystem         //< Output directory or published playlist not writable
};

inline const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Scan:
    return "scan";
  case ErrorKind::Encode:
    return "encode";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::PlaylistSynthesis:
    return "playlist";
  case ErrorKind::Filesystem:
    return "filesystem";
  }
  return "unknown";
}

/**
 * @struct VariantError
 * @brief Error detail carried by a failed build step.
 */
struct VariantError {
  ErrorKind kind = ErrorKind::None;
  std::string step;   //< Step that failed ("segment", "lead-in", ...)
  std::string detail; //< Engine diagnostics or I/O message, verbatim
};

enum class VariantOutcome {
  Built,    //< Generated during this run
  Skipped,  //< Playlist already present
  Failed,   //< Build attempted and failed
  Cancelled //< Not attempted because an earlier failure aborted the run
};

inline const char *outcome_name(VariantOutcome outcome) {
  switch (outcome) {
  case VariantOutcome::Built:
    return "built";
  case VariantOutcome::Skipped:
    return "skipped";
  case VariantOutcome::Failed:
    return "failed";
  case VariantOutcome::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

/**
 * @struct VariantResult
 * @brief Outcome of one asset x variant job.
 */
struct VariantResult {
  std::string asset_name;    //< Source file name
  std::string suffix;        //< Variant suffix
  std::string playlist_path; //< Canonical playlist path
  VariantOutcome outcome = VariantOutcome::Cancelled;
  VariantError error;           //< Set when outcome == Failed
  long processing_time_us = 0; //< Build time in microseconds
};

} // namespace hls_variants

#endif // HLS_VARIANTS_TYPES_HPP
