/**
 * @file temp_dir.hpp
 * @brief Per-test scratch directory, removed on destruction
 */

#ifndef HLS_VARIANTS_TESTS_TEMP_DIR_HPP
#define HLS_VARIANTS_TESTS_TEMP_DIR_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace hls_variants {
namespace test_support {

class TempDir {
public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "hls_variants_XXXXXX")
            .string();
    if (::mkdtemp(&pattern[0]) != nullptr)
      path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    if (!path_.empty())
      std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::string &path() const { return path_; }

  std::string file(const std::string &name) const {
    return (std::filesystem::path(path_) / name).string();
  }

private:
  std::string path_;
};

inline void write_file(const std::string &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

} // namespace test_support
} // namespace hls_variants

#endif // HLS_VARIANTS_TESTS_TEMP_DIR_HPP
