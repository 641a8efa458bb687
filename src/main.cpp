/**
 * @file main.cpp
 * @brief Entry point for the HLS variant generator
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Generation mode: one pipeline run over the uploads root
 *
 *          - Listing modes: --list, --show <name> and
 *            --variant <name> <suffix>
 *
 * @note The uploads root defaults to UPLOADS_DIR. Set PARALLEL_VARIANTS to
 *       build several variants at once and FAIL_FAST=1 to stop at the first
 *       failure.
 */

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "hls_variants/config.hpp"
#include "hls_variants/ffmpeg_executor.hpp"
#include "hls_variants/logging.hpp"
#include "hls_variants/pipeline.hpp"
#include "hls_variants/video_listing.hpp"

using namespace hls_variants;

namespace {

void print_usage() {
  LOG_WARN("Usage: ./hls_variants [uploads_dir]\n"
           "       ./hls_variants --list [uploads_dir]\n"
           "       ./hls_variants --show <video_name> [uploads_dir]\n"
           "       ./hls_variants --variant <video_name> <suffix> [uploads_dir]");
}

int run_list(const std::string &root) {
  std::vector<VideoEntry> entries;
  std::string error;
  if (!list_videos(root, entries, error)) {
    LOG_ERROR("Failed to list videos: {}", error);
    return 1;
  }
  if (entries.empty()) {
    LOG_INFO("No videos in {}", root);
    return 0;
  }
  for (const auto &entry : entries) {
    print_video_entry(entry);
  }
  return 0;
}

int run_show(const std::string &root, const std::string &name) {
  VideoEntry entry;
  std::string error;
  if (!find_video(root, name, entry, error)) {
    LOG_ERROR("{}", error);
    return 1;
  }
  print_video_entry(entry);
  return 0;
}

int run_variant(const std::string &root, const std::string &name,
                const std::string &suffix) {
  VariantLink link;
  std::string error;
  if (!find_video_variant(root, name, suffix, link, error)) {
    LOG_ERROR("{}", error);
    return 1;
  }
  if (!link.available) {
    LOG_WARN("{} ({}) has not been generated yet: {}", name, link.suffix,
             link.playlist_uri);
    return 1;
  }
  fmt::print("{}\n", link.playlist_uri);
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::vector<std::string> args(argv + 1, argv + argc);

  if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
    print_usage();
    return 0;
  }

  // **---- LISTING MODES ----**

  if (!args.empty() && args[0] == "--list") {
    if (args.size() > 2) {
      print_usage();
      return 1;
    }
    return run_list(args.size() == 2 ? args[1] : Config::uploads_dir());
  }

  if (!args.empty() && args[0] == "--show") {
    if (args.size() < 2 || args.size() > 3) {
      print_usage();
      return 1;
    }
    return run_show(args.size() == 3 ? args[2] : Config::uploads_dir(),
                    args[1]);
  }

  if (!args.empty() && args[0] == "--variant") {
    if (args.size() < 3 || args.size() > 4) {
      print_usage();
      return 1;
    }
    return run_variant(args.size() == 4 ? args[3] : Config::uploads_dir(),
                       args[1], args[2]);
  }

  // **---- GENERATION MODE ----**

  if (args.size() > 1 || (!args.empty() && args[0].rfind("-", 0) == 0)) {
    print_usage();
    return 1;
  }

  std::string root = args.empty() ? Config::uploads_dir() : args[0];

  LOG_INFO("HLS Variant Generator");
  LOG_INFO("Uploads directory: {}", root);
  LOG_INFO("Engine: {} (timeout {}s)", Config::ffmpeg_bin(),
           Config::engine_timeout_sec());

  auto start_time = std::chrono::steady_clock::now();

  FFmpegEngine engine(Config::ffmpeg_bin(), Config::engine_timeout_sec());
  VariantPipeline pipeline(engine, PipelineOptions::from_config());
  PipelineReport report = pipeline.run(root);

  auto end_time = std::chrono::steady_clock::now();
  double wall_clock_sec =
      std::chrono::duration<double>(end_time - start_time).count();

  print_report(report, wall_clock_sec);
  TimingCollector::print_summary();

  return report.ok() ? 0 : 1;
}
