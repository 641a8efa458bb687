/**
 * @file variant_catalog.hpp
 * @brief The fixed table of renditions and their output layout
 *
 * @details Ten renditions per asset: segment durations {0.5, 1, 4, 8, 12}
 *          seconds, each as a normal (codec copy) and a fast-start variant.
 *          Iteration order is durations ascending, normal before fast-start,
 *          so logs and reports are deterministic.
 */

#ifndef HLS_VARIANTS_VARIANT_CATALOG_HPP
#define HLS_VARIANTS_VARIANT_CATALOG_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace hls_variants {

/**
 * @brief The immutable rendition catalog.
 * @return Reference to a statically constructed table of VARIANT_COUNT specs
 */
const std::vector<VariantSpec> &variant_catalog();

/**
 * @brief Look up a catalog entry by its suffix.
 * @return Pointer into the catalog, or nullptr when unknown
 */
const VariantSpec *find_variant(const std::string &suffix);

/**
 * @brief EXT-X-TARGETDURATION for a variant: ceil(segment duration).
 */
int target_duration(const VariantSpec &spec);

/**
 * @brief Name of the directory holding one rendition: "{base}_{suffix}".
 */
std::string variant_dir_name(const VideoAsset &asset, const VariantSpec &spec);

/**
 * @brief Compute every path used while building one rendition.
 * @param uploads_root Root directory scanned for assets
 * @param asset Source asset
 * @param spec Catalog entry
 */
VariantPaths variant_paths(const std::string &uploads_root,
                           const VideoAsset &asset, const VariantSpec &spec);

} // namespace hls_variants

#endif // HLS_VARIANTS_VARIANT_CATALOG_HPP
