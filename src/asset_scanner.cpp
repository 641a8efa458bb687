/**
 * @file asset_scanner.cpp
 * @brief Uploads root scanning implementation
 */

#include "hls_variants/asset_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <system_error>

#include <fmt/core.h>

#include "hls_variants/logging.hpp"

namespace hls_variants {

namespace fs = std::filesystem;

namespace {

constexpr const char *VIDEO_EXTENSIONS[] = {".mp4", ".avi", ".mov", ".mkv",
                                            ".webm", ".flv", ".wmv"};

} // anonymous namespace

bool is_video_file_name(const std::string &file_name) {
  std::string ext = fs::path(file_name).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  for (const char *candidate : VIDEO_EXTENSIONS) {
    if (ext == candidate)
      return true;
  }
  return false;
}

VideoAsset make_asset(const std::string &path) {
  fs::path p(path);
  VideoAsset asset;
  asset.path = p.string();
  asset.file_name = p.filename().string();
  asset.base_name = p.stem().string();
  return asset;
}

bool scan_assets(const std::string &uploads_root,
                 std::vector<VideoAsset> &assets, std::string &error) {
  assets.clear();

  std::error_code ec;
  fs::directory_iterator it(uploads_root, ec);
  if (ec) {
    error = fmt::format("cannot read {}: {}", uploads_root, ec.message());
    return false;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec))
      continue;
    if (!is_video_file_name(it->path().filename().string()))
      continue;
    assets.push_back(make_asset(it->path().string()));
  }
  if (ec) {
    error = fmt::format("error while reading {}: {}", uploads_root,
                        ec.message());
    return false;
  }

  std::sort(assets.begin(), assets.end(),
            [](const VideoAsset &a, const VideoAsset &b) {
              return a.file_name < b.file_name;
            });

  /// Assets sharing a base name map to the same variant directories
  std::map<std::string, std::string> owners;
  for (const auto &asset : assets) {
    auto inserted = owners.emplace(asset.base_name, asset.file_name);
    if (!inserted.second) {
      LOG_WARN("{} and {} share base name '{}'; their variants collide and "
               "only the first one is built",
               inserted.first->second, asset.file_name, asset.base_name);
    }
  }
  return true;
}

} // namespace hls_variants
