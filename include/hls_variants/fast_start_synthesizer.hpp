/**
 * @file fast_start_synthesizer.hpp
 * @brief Fast-start rendition builder
 *
 * @details Produces the same playlist shape as the normal segmenter, but the
 *          first segment is a tiny re-encode so playback can start almost
 *          immediately on a slow link:
 *
 *          1. Ensure output directory
 *
 *          2. Lead-in: re-encode the first segment_duration seconds to
 *             160x90 / 10 fps / ~50 kbps, mono low-rate audio, as
 *             segment000.ts
 *
 *          3. Remainder: codec-copy segmenting starting past the lead-in,
 *             numbering from 1, into the staging playlist
 *
 *          4. Synthesis: strict-parse the staging playlist and splice the
 *             lead-in entry in front of its segments
 *
 *          5. Publish the new playlist atomically
 *
 * @note Any step failing aborts the rendition. Segment files already written
 *       are left in place; without a canonical playlist they are ignored and
 *       rebuilt from step 1 on the next run.
 */

#ifndef HLS_VARIANTS_FAST_START_SYNTHESIZER_HPP
#define HLS_VARIANTS_FAST_START_SYNTHESIZER_HPP

#include <string>

#include "media_playlist.hpp"
#include "transcode_engine.hpp"
#include "types.hpp"

namespace hls_variants {

/**
 * @brief Engine request for the degraded lead-in segment.
 * @note Quality knobs come from Config (LEAD_IN_* variables).
 */
ClipRequest lead_in_request(const VideoAsset &asset, const VariantSpec &spec,
                            const VariantPaths &paths);

/**
 * @brief Splice the lead-in entry in front of the remainder's segments.
 *
 * @param remainder Strictly parsed remainder playlist
 * @param spec Catalog entry (fixes the lead-in duration and target duration)
 * @param playlist Output: synthesized playlist
 * @param error Output: why the remainder was rejected
 * @return false when remainder URIs are not segment001.ts, segment002.ts,
 *         ... in order
 */
bool synthesize_fast_start_playlist(const MediaPlaylist &remainder,
                                    const VariantSpec &spec,
                                    MediaPlaylist &playlist,
                                    std::string &error);

/**
 * @brief Build a fast-start rendition.
 *
 * @param engine Transcoding engine
 * @param asset Source asset
 * @param spec Catalog entry (fast_start == true)
 * @param paths Output layout for asset x spec
 * @param error Output: failing step and diagnostics
 * @return true when paths.playlist_path has been published
 */
bool build_fast_start_variant(TranscodeEngine &engine, const VideoAsset &asset,
                              const VariantSpec &spec,
                              const VariantPaths &paths, VariantError &error);

} // namespace hls_variants

#endif // HLS_VARIANTS_FAST_START_SYNTHESIZER_HPP
