/**
 * @file variant_catalog.cpp
 * @brief Rendition catalog and output path derivation
 */

#include "hls_variants/variant_catalog.hpp"

#include <cmath>
#include <filesystem>

namespace hls_variants {

namespace fs = std::filesystem;

const std::vector<VariantSpec> &variant_catalog() {
  static const std::vector<VariantSpec> catalog = {
      {0.5, "500ms", false}, {0.5, "500ms_fast", true},
      {1.0, "1s", false},    {1.0, "1s_fast", true},
      {4.0, "4s", false},    {4.0, "4s_fast", true},
      {8.0, "8s", false},    {8.0, "8s_fast", true},
      {12.0, "12s", false},  {12.0, "12s_fast", true},
  };
  return catalog;
}

const VariantSpec *find_variant(const std::string &suffix) {
  for (const auto &spec : variant_catalog()) {
    if (suffix == spec.suffix)
      return &spec;
  }
  return nullptr;
}

int target_duration(const VariantSpec &spec) {
  return static_cast<int>(std::ceil(spec.segment_duration_sec));
}

std::string variant_dir_name(const VideoAsset &asset, const VariantSpec &spec) {
  return asset.base_name + "_" + spec.suffix;
}

VariantPaths variant_paths(const std::string &uploads_root,
                           const VideoAsset &asset, const VariantSpec &spec) {
  fs::path dir = fs::path(uploads_root) / variant_dir_name(asset, spec);

  VariantPaths paths;
  paths.output_dir = dir.string();
  paths.playlist_path = (dir / PLAYLIST_FILE_NAME).string();
  paths.staging_playlist_path = (dir / STAGING_PLAYLIST_FILE_NAME).string();
  paths.segment_pattern = (dir / SEGMENT_FILE_PATTERN).string();
  paths.lead_in_segment_path = (dir / "segment000.ts").string();
  return paths;
}

} // namespace hls_variants
