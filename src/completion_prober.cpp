/**
 * @file completion_prober.cpp
 * @brief Completion checks over the output layout
 */

#include "hls_variants/completion_prober.hpp"

#include <filesystem>
#include <system_error>

#include "hls_variants/variant_catalog.hpp"

namespace hls_variants {

bool variant_complete(const VariantPaths &paths) {
  std::error_code ec;
  return std::filesystem::is_regular_file(paths.playlist_path, ec);
}

bool asset_complete(const std::string &uploads_root, const VideoAsset &asset) {
  for (const auto &spec : variant_catalog()) {
    if (!variant_complete(variant_paths(uploads_root, asset, spec)))
      return false;
  }
  return true;
}

} // namespace hls_variants
