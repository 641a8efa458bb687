/**
 * @file test_system.cpp
 * @brief File helper tests
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "hls_variants/system.hpp"
#include "support/temp_dir.hpp"

using namespace hls_variants;
using hls_variants::test_support::read_file;
using hls_variants::test_support::TempDir;
using hls_variants::test_support::write_file;

namespace fs = std::filesystem;

TEST(PublishFile, MovesCompleteFileIntoPlace) {
  TempDir dir;
  write_file(dir.file(".engine.m3u8"), "#EXTM3U\n");
  write_file(dir.file("playlist.m3u8"), "stale");

  std::string error;
  ASSERT_TRUE(publish_file(dir.file(".engine.m3u8"), dir.file("playlist.m3u8"),
                           error))
      << error;
  EXPECT_EQ(read_file(dir.file("playlist.m3u8")), "#EXTM3U\n");
  EXPECT_FALSE(fs::exists(dir.file(".engine.m3u8")));
}

TEST(PublishFile, MissingSourceFails) {
  TempDir dir;
  std::string error;
  EXPECT_FALSE(publish_file(dir.file("absent"), dir.file("playlist.m3u8"),
                            error));
  EXPECT_NE(error.find("absent"), std::string::npos) << error;
  EXPECT_FALSE(fs::exists(dir.file("playlist.m3u8")));
}

TEST(WriteFileAtomic, ReplacesContentAndCleansTemporary) {
  TempDir dir;
  write_file(dir.file("playlist.m3u8"), "old");

  std::string error;
  ASSERT_TRUE(write_file_atomic(dir.file("playlist.m3u8"), "new", error))
      << error;
  EXPECT_EQ(read_file(dir.file("playlist.m3u8")), "new");
  EXPECT_FALSE(fs::exists(dir.file("playlist.m3u8.tmp")));
}

TEST(EnsureDirectory, CreatesParents) {
  TempDir dir;
  std::string error;
  EXPECT_TRUE(ensure_directory(dir.file("a/b/c"), error)) << error;
  EXPECT_TRUE(fs::is_directory(dir.file("a/b/c")));
  EXPECT_TRUE(ensure_directory(dir.file("a/b/c"), error));
}

TEST(EnsureDirectory, RegularFileInPathFails) {
  TempDir dir;
  write_file(dir.file("blocker"), "x");
  std::string error;
  EXPECT_FALSE(ensure_directory(dir.file("blocker"), error));
  EXPECT_FALSE(error.empty());
  error.clear();
  EXPECT_FALSE(ensure_directory(dir.file("blocker/child"), error));
  EXPECT_FALSE(error.empty());
}
