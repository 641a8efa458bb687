/**
 * @file normal_segmenter.hpp
 * @brief Codec-copy rendition builder
 *
 * @details One engine invocation cuts the source into fixed-length segments
 *          without re-encoding. The engine writes its playlist under a
 *          staging name; after the engine exits and the playlist validates,
 *          it is renamed to the canonical name. A crash mid-build therefore
 *          never leaves a canonical playlist behind.
 */

#ifndef HLS_VARIANTS_NORMAL_SEGMENTER_HPP
#define HLS_VARIANTS_NORMAL_SEGMENTER_HPP

#include "transcode_engine.hpp"
#include "types.hpp"

namespace hls_variants {

/**
 * @brief Build a normal (codec copy) rendition.
 *
 * @param engine Transcoding engine
 * @param asset Source asset
 * @param spec Catalog entry (fast_start == false)
 * @param paths Output layout for asset x spec
 * @param error Output: failing step and diagnostics
 * @return true when paths.playlist_path has been published
 */
bool build_normal_variant(TranscodeEngine &engine, const VideoAsset &asset,
                          const VariantSpec &spec, const VariantPaths &paths,
                          VariantError &error);

/**
 * @brief Create the output directory and drop stale staging files.
 * @note Shared by both builders. Segment files from an earlier failed
 *       attempt are left in place; the engine overwrites them.
 *       Failures are reported as ErrorKind::Filesystem, step "prepare".
 */
bool prepare_output_dir(const VariantPaths &paths, VariantError &error);

} // namespace hls_variants

#endif // HLS_VARIANTS_NORMAL_SEGMENTER_HPP
