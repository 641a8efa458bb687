/**
 * @file media_playlist.cpp
 * @brief HLS media playlist parser and serializer
 */

#include "hls_variants/media_playlist.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

namespace hls_variants {

namespace {

constexpr const char *TAG_HEADER = "#EXTM3U";
constexpr const char *TAG_EXTINF = "#EXTINF:";
constexpr const char *TAG_VERSION = "#EXT-X-VERSION:";
constexpr const char *TAG_TARGET_DURATION = "#EXT-X-TARGETDURATION:";
constexpr const char *TAG_MEDIA_SEQUENCE = "#EXT-X-MEDIA-SEQUENCE:";
constexpr const char *TAG_ENDLIST = "#EXT-X-ENDLIST";

/// Header tags accepted and discarded
constexpr const char *IGNORED_HEADER_TAGS[] = {
    "#EXT-X-PLAYLIST-TYPE:", "#EXT-X-ALLOW-CACHE:",
    "#EXT-X-INDEPENDENT-SEGMENTS"};

bool has_prefix(const std::string &line, const char *prefix) {
  return line.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string tag_value(const std::string &line, const char *prefix) {
  return line.substr(std::strlen(prefix));
}

/// Tag name without its value, for error messages
std::string tag_name(const std::string &line) {
  return line.substr(0, line.find(':'));
}

bool parse_long(const std::string &text, long &out) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  long val = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  out = val;
  return true;
}

bool parse_double(const std::string &text, double &out) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  double val = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0' || val < 0)
    return false;
  out = val;
  return true;
}

/// Strip trailing CR and surrounding blanks
std::string trim(const std::string &line) {
  size_t begin = line.find_first_not_of(" \t\r");
  if (begin == std::string::npos)
    return "";
  size_t end = line.find_last_not_of(" \t\r");
  return line.substr(begin, end - begin + 1);
}

} // anonymous namespace

bool parse_media_playlist(const std::string &text, ParseMode mode,
                          MediaPlaylist &playlist, std::string &error) {
  playlist = MediaPlaylist{};
  const bool strict = (mode == ParseMode::Strict);

  bool seen_header = false;
  bool seen_segment = false;
  bool pending = false; //< #EXTINF seen, URI not yet
  MediaSegment current;

  size_t pos = 0;
  int line_no = 0;
  while (pos <= text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string::npos)
      nl = text.size();
    std::string line = trim(text.substr(pos, nl - pos));
    pos = nl + 1;
    ++line_no;

    if (line.empty())
      continue;

    if (!seen_header) {
      if (line != TAG_HEADER) {
        error = fmt::format("line {}: expected {}", line_no, TAG_HEADER);
        return false;
      }
      seen_header = true;
      continue;
    }

    if (playlist.end_list) {
      error = fmt::format("line {}: content after {}", line_no, TAG_ENDLIST);
      return false;
    }

    // **---- URI lines ----**

    if (line[0] != '#') {
      if (!pending) {
        error = fmt::format("line {}: URI '{}' without #EXTINF", line_no, line);
        return false;
      }
      current.uri = line;
      playlist.segments.push_back(current);
      current = MediaSegment{};
      pending = false;
      continue;
    }

    /// Plain comments are not tags
    if (!has_prefix(line, "#EXT"))
      continue;

    if (pending && strict) {
      error = fmt::format("line {}: {} between #EXTINF and its URI", line_no,
                          tag_name(line));
      return false;
    }

    // **---- Segment tags ----**

    if (has_prefix(line, TAG_EXTINF)) {
      if (pending) {
        error = fmt::format("line {}: #EXTINF without URI", line_no);
        return false;
      }
      std::string value = tag_value(line, TAG_EXTINF);
      size_t comma = value.find(',');
      std::string duration_text = value.substr(0, comma);
      if (!parse_double(duration_text, current.duration)) {
        error = fmt::format("line {}: bad #EXTINF duration '{}'", line_no,
                            duration_text);
        return false;
      }
      current.title = (comma == std::string::npos) ? "" : value.substr(comma + 1);
      pending = true;
      seen_segment = true;
      continue;
    }

    if (line == TAG_ENDLIST) {
      playlist.end_list = true;
      continue;
    }

    // **---- Header tags ----**

    bool is_header = true;
    long number = 0;
    if (has_prefix(line, TAG_VERSION)) {
      if (!parse_long(tag_value(line, TAG_VERSION), number)) {
        error = fmt::format("line {}: bad #EXT-X-VERSION", line_no);
        return false;
      }
      playlist.version = static_cast<int>(number);
    } else if (has_prefix(line, TAG_TARGET_DURATION)) {
      if (!parse_long(tag_value(line, TAG_TARGET_DURATION), number)) {
        error = fmt::format("line {}: bad #EXT-X-TARGETDURATION", line_no);
        return false;
      }
      playlist.target_duration = static_cast<int>(number);
    } else if (has_prefix(line, TAG_MEDIA_SEQUENCE)) {
      if (!parse_long(tag_value(line, TAG_MEDIA_SEQUENCE), number)) {
        error = fmt::format("line {}: bad #EXT-X-MEDIA-SEQUENCE", line_no);
        return false;
      }
      playlist.media_sequence = number;
    } else {
      is_header = false;
      for (const char *tag : IGNORED_HEADER_TAGS) {
        if (has_prefix(line, tag)) {
          is_header = true;
          break;
        }
      }
    }

    if (!is_header) {
      if (strict) {
        error = fmt::format("line {}: unsupported tag {}", line_no,
                            tag_name(line));
        return false;
      }
      continue;
    }

    if (strict && seen_segment) {
      error = fmt::format("line {}: header tag {} after first segment",
                          line_no, tag_name(line));
      return false;
    }
  }

  if (!seen_header) {
    error = fmt::format("empty playlist (missing {})", TAG_HEADER);
    return false;
  }
  if (pending) {
    error = "last #EXTINF has no URI";
    return false;
  }
  if (!playlist.end_list) {
    error = fmt::format("missing {} (playlist incomplete)", TAG_ENDLIST);
    return false;
  }
  return true;
}

std::string format_extinf(double duration, const std::string &title) {
  return fmt::format("{}{:.6f},{}", TAG_EXTINF, duration, title);
}

std::string serialize_media_playlist(const MediaPlaylist &playlist) {
  std::string out;
  out.reserve(128 + playlist.segments.size() * 40);

  out += fmt::format("{}\n", TAG_HEADER);
  out += fmt::format("{}{}\n", TAG_VERSION, playlist.version);
  out += fmt::format("{}{}\n", TAG_TARGET_DURATION, playlist.target_duration);
  out += fmt::format("{}{}\n", TAG_MEDIA_SEQUENCE, playlist.media_sequence);

  for (const auto &seg : playlist.segments) {
    out += format_extinf(seg.duration, seg.title);
    out += '\n';
    out += seg.uri;
    out += '\n';
  }

  if (playlist.end_list) {
    out += fmt::format("{}\n", TAG_ENDLIST);
  }
  return out;
}

std::string segment_file_name(int index) {
  return fmt::format("segment{:03d}.ts", index);
}

std::vector<std::string> missing_segment_files(const MediaPlaylist &playlist,
                                               const std::string &dir) {
  std::vector<std::string> missing;
  for (const auto &seg : playlist.segments) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(std::filesystem::path(dir) / seg.uri,
                                          ec)) {
      missing.push_back(seg.uri);
    }
  }
  return missing;
}

} // namespace hls_variants
