/**
 * @file completion_prober.hpp
 * @brief Decides whether a rendition must be built
 *
 * @details A rendition is complete iff its canonical playlist exists as a
 *          regular file. Directory presence, the engine's staging playlist
 *          and a lone lead-in segment never count. The check is point in
 *          time: callers re-probe right before each build.
 */

#ifndef HLS_VARIANTS_COMPLETION_PROBER_HPP
#define HLS_VARIANTS_COMPLETION_PROBER_HPP

#include <string>

#include "types.hpp"

namespace hls_variants {

/**
 * @brief Check whether the canonical playlist of a rendition exists.
 * @note No side effects; filesystem errors read as "not complete".
 */
bool variant_complete(const VariantPaths &paths);

/**
 * @brief Check whether every catalog rendition of an asset is complete.
 */
bool asset_complete(const std::string &uploads_root, const VideoAsset &asset);

} // namespace hls_variants

#endif // HLS_VARIANTS_COMPLETION_PROBER_HPP
