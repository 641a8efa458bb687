/**
 * @file video_listing.hpp
 * @brief Per-asset listing of original and variant playlist URIs
 *
 * @details URIs are relative to the static file layer, which serves the
 *          uploads root under /videos/.
 */

#ifndef HLS_VARIANTS_VIDEO_LISTING_HPP
#define HLS_VARIANTS_VIDEO_LISTING_HPP

#include <string>
#include <vector>

namespace hls_variants {

/// URI prefix under which the uploads root is served
constexpr const char *VIDEOS_URI_PREFIX = "/videos/";

struct VariantLink {
  std::string suffix;       //< Catalog suffix
  std::string playlist_uri; //< /videos/{base}_{suffix}/playlist.m3u8
  bool available = false;   //< Canonical playlist exists on disk
};

/**
 * @struct VideoEntry
 * @brief One source video and the URIs of its renditions.
 */
struct VideoEntry {
  std::string name;      //< Source file name
  std::string base_name; //< File name without extension
  std::string original;  //< /videos/{name}
  std::vector<VariantLink> variants; //< Catalog order
};

/**
 * @brief List every video in the uploads root.
 * @param uploads_root Directory holding source videos
 * @param entries Output entries in discovery order (empty if root missing)
 * @param error Output error message when the root cannot be read
 * @return true on success
 */
bool list_videos(const std::string &uploads_root,
                 std::vector<VideoEntry> &entries, std::string &error);

/**
 * @brief Look up a single video by file name.
 * @return false if the name is not a plain file name of an existing file
 */
bool find_video(const std::string &uploads_root, const std::string &name,
                VideoEntry &entry, std::string &error);

/**
 * @brief Look up one rendition of a video by catalog suffix.
 * @return false if the video is unknown or the suffix is not in the catalog
 */
bool find_video_variant(const std::string &uploads_root,
                        const std::string &name, const std::string &suffix,
                        VariantLink &link, std::string &error);

void print_video_entry(const VideoEntry &entry);

} // namespace hls_variants

#endif // HLS_VARIANTS_VIDEO_LISTING_HPP
