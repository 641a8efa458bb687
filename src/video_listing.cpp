/**
 * @file video_listing.cpp
 * @brief Video listing implementation
 */

#include "hls_variants/video_listing.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "hls_variants/asset_scanner.hpp"
#include "hls_variants/completion_prober.hpp"
#include "hls_variants/types.hpp"
#include "hls_variants/variant_catalog.hpp"

namespace hls_variants {

namespace fs = std::filesystem;

namespace {

VideoEntry make_entry(const std::string &uploads_root,
                      const VideoAsset &asset) {
  VideoEntry entry;
  entry.name = asset.file_name;
  entry.base_name = asset.base_name;
  entry.original = fmt::format("{}{}", VIDEOS_URI_PREFIX, asset.file_name);

  for (const auto &spec : variant_catalog()) {
    VariantLink link;
    link.suffix = spec.suffix;
    link.playlist_uri =
        fmt::format("{}{}/{}", VIDEOS_URI_PREFIX,
                    variant_dir_name(asset, spec), PLAYLIST_FILE_NAME);
    link.available =
        variant_complete(variant_paths(uploads_root, asset, spec));
    entry.variants.push_back(std::move(link));
  }
  return entry;
}

} // anonymous namespace

bool list_videos(const std::string &uploads_root,
                 std::vector<VideoEntry> &entries, std::string &error) {
  entries.clear();

  std::error_code ec;
  if (!fs::exists(uploads_root, ec))
    return !ec;

  std::vector<VideoAsset> assets;
  if (!scan_assets(uploads_root, assets, error))
    return false;

  for (const auto &asset : assets) {
    entries.push_back(make_entry(uploads_root, asset));
  }
  return true;
}

bool find_video(const std::string &uploads_root, const std::string &name,
                VideoEntry &entry, std::string &error) {
  if (name.empty() || name.find('/') != std::string::npos || name == "." ||
      name == "..") {
    error = fmt::format("invalid video name '{}'", name);
    return false;
  }

  std::error_code ec;
  fs::path path = fs::path(uploads_root) / name;
  if (!fs::is_regular_file(path, ec)) {
    error = fmt::format("video not found: {}", name);
    return false;
  }

  entry = make_entry(uploads_root, make_asset(path.string()));
  return true;
}

bool find_video_variant(const std::string &uploads_root,
                        const std::string &name, const std::string &suffix,
                        VariantLink &link, std::string &error) {
  if (find_variant(suffix) == nullptr) {
    error = fmt::format("unknown variant '{}'", suffix);
    return false;
  }

  VideoEntry entry;
  if (!find_video(uploads_root, name, entry, error))
    return false;

  for (const auto &candidate : entry.variants) {
    if (candidate.suffix == suffix) {
      link = candidate;
      return true;
    }
  }
  error = fmt::format("unknown variant '{}'", suffix);
  return false;
}

void print_video_entry(const VideoEntry &entry) {
  fmt::print(fg(fmt::color::cyan), "{}\n", entry.name);
  fmt::print("  {:<12} {}\n", "original", entry.original);
  for (const auto &link : entry.variants) {
    if (link.available) {
      fmt::print("  {:<12} {}\n", link.suffix, link.playlist_uri);
    } else {
      fmt::print(fg(fmt::color::gray), "  {:<12} {} (missing)\n", link.suffix,
                 link.playlist_uri);
    }
  }
}

} // namespace hls_variants
