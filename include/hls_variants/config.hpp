/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values are read once on first use and never change afterwards.
 *
 */

#ifndef HLS_VARIANTS_CONFIG_HPP
#define HLS_VARIANTS_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace hls_variants {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable value or default
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- PATHS ----**

/// Uploads root used when none is given on the command line
inline const std::string &uploads_dir() {
  static const std::string val = get_env_string("UPLOADS_DIR", "uploads");
  return val;
}

/// Transcoding engine executable (looked up on PATH when not absolute)
inline const std::string &ffmpeg_bin() {
  static const std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

// **---- EXECUTION ----**

/**
 * @brief Upper bound for a single engine invocation, in seconds
 * @note 0 disables the timeout. A timed-out engine process is killed and the
 *       variant is reported as failed.
 */
inline int engine_timeout_sec() {
  static int val = get_env_int("ENGINE_TIMEOUT_SEC", 3600);
  return val;
}

/**
 * @brief Number of variant workers
 * @note 1 keeps the strictly sequential order (one engine process at a
 *       time). 0 = one worker per available CPU.
 */
inline int parallel_variants() {
  static int val = get_env_int("PARALLEL_VARIANTS", 1);
  return val;
}

/**
 * @brief Abort the remaining jobs after the first failed variant
 * @note Default keeps building the other variants and reports every
 *       failure at the end of the run.
 */
inline bool fail_fast() {
  static bool val = (get_env_int("FAIL_FAST", 0) != 0);
  return val;
}

// **---- FAST-START LEAD-IN ----**

inline int lead_in_width() {
  static int val = get_env_int("LEAD_IN_WIDTH", 160);
  return val;
}

inline int lead_in_height() {
  static int val = get_env_int("LEAD_IN_HEIGHT", 90);
  return val;
}

inline int lead_in_fps() {
  static int val = get_env_int("LEAD_IN_FPS", 10);
  return val;
}

/// Video bitrate, also used as the max rate (buffer is twice this)
inline int lead_in_video_kbps() {
  static int val = get_env_int("LEAD_IN_VIDEO_KBPS", 50);
  return val;
}

inline int lead_in_audio_kbps() {
  static int val = get_env_int("LEAD_IN_AUDIO_KBPS", 32);
  return val;
}

inline int lead_in_sample_rate() {
  static int val = get_env_int("LEAD_IN_SAMPLE_RATE", 22050);
  return val;
}

} // namespace Config
} // namespace hls_variants

#endif // HLS_VARIANTS_CONFIG_HPP
