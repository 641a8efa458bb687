/**
 * @file media_playlist.hpp
 * @brief Typed HLS media playlist: parse, serialize, validate
 *
 * @details Only the subset needed for on-demand media playlists is modelled:
 *          version, target duration, media sequence, (duration, URI) entries
 *          and the end-list marker.
 *
 * @attention PARSE MODES:
 *
 *   - Lenient: unknown tags are ignored (validating engine output that is
 *     published verbatim)
 *
 *   - Strict: any tag outside the recognized header set, or a header tag
 *     after the first segment, is an error. Used when entries are re-emitted
 *     into a new playlist, so nothing is dropped silently.
 */

#ifndef HLS_VARIANTS_MEDIA_PLAYLIST_HPP
#define HLS_VARIANTS_MEDIA_PLAYLIST_HPP

#include <string>
#include <vector>

namespace hls_variants {

/**
 * @struct MediaSegment
 * @brief One #EXTINF / URI pair.
 */
struct MediaSegment {
  double duration = 0; //< Seconds, from #EXTINF
  std::string title;   //< Text after the comma in #EXTINF (usually empty)
  std::string uri;     //< Segment URI, relative to the playlist
};

/**
 * @struct MediaPlaylist
 * @brief Parsed HLS media playlist.
 */
struct MediaPlaylist {
  int version = 3;
  int target_duration = 0;
  long media_sequence = 0;
  std::vector<MediaSegment> segments;
  bool end_list = false;
};

enum class ParseMode { Lenient, Strict };

/**
 * @brief Parse playlist text.
 *
 * @note Both modes require the #EXTM3U header, a URI after every #EXTINF and
 *       a closing #EXT-X-ENDLIST (the engine writes it last, so its absence
 *       means the playlist is incomplete).
 *
 * @param text Playlist contents (LF or CRLF line endings)
 * @param mode Strict or lenient tag handling
 * @param playlist Output: parsed playlist
 * @param error Output: message with line number on failure
 * @return true on success
 */
bool parse_media_playlist(const std::string &text, ParseMode mode,
                          MediaPlaylist &playlist, std::string &error);

/**
 * @brief Serialize to playlist text.
 * @note Header order: #EXTM3U, VERSION, TARGETDURATION, MEDIA-SEQUENCE.
 *       Durations are written with six decimals ("#EXTINF:4.000000,").
 */
std::string serialize_media_playlist(const MediaPlaylist &playlist);

/**
 * @brief "#EXTINF:<duration>,<title>" line.
 */
std::string format_extinf(double duration, const std::string &title = "");

/**
 * @brief Segment file name for an ordinal: 7 -> "segment007.ts".
 */
std::string segment_file_name(int index);

/**
 * @brief List segment URIs whose files are missing from a directory.
 * @param playlist Parsed playlist
 * @param dir Directory the URIs are relative to
 * @return Missing URIs, in playlist order (empty = all present)
 */
std::vector<std::string> missing_segment_files(const MediaPlaylist &playlist,
                                               const std::string &dir);

} // namespace hls_variants

#endif // HLS_VARIANTS_MEDIA_PLAYLIST_HPP
