/**
 * @file asset_scanner.hpp
 * @brief Discovery of source videos in the uploads root
 *
 * @details Non-recursive: only regular files directly inside the root are
 *          considered, and only those with a video extension (compared
 *          case-insensitively). Generated variant directories are skipped
 *          naturally because they are directories.
 */

#ifndef HLS_VARIANTS_ASSET_SCANNER_HPP
#define HLS_VARIANTS_ASSET_SCANNER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace hls_variants {

/**
 * @brief Check a file name against the accepted video extensions.
 * @note .mp4 .avi .mov .mkv .webm .flv .wmv, any letter case
 */
bool is_video_file_name(const std::string &file_name);

/**
 * @brief Build an asset record for a source path.
 */
VideoAsset make_asset(const std::string &path);

/**
 * @brief List the video assets of an uploads root.
 *
 * @param uploads_root Directory to scan
 * @param assets Output: assets sorted by file name
 * @param error Output: message when the directory cannot be read
 * @return true on success (an empty result is a success)
 */
bool scan_assets(const std::string &uploads_root,
                 std::vector<VideoAsset> &assets, std::string &error);

} // namespace hls_variants

#endif // HLS_VARIANTS_ASSET_SCANNER_HPP
