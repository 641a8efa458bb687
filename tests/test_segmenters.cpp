/**
 * @file test_segmenters.cpp
 * @brief Normal and fast-start variant builder tests
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "hls_variants/completion_prober.hpp"
#include "hls_variants/fast_start_synthesizer.hpp"
#include "hls_variants/media_playlist.hpp"
#include "hls_variants/normal_segmenter.hpp"
#include "hls_variants/variant_catalog.hpp"
#include "support/fake_engine.hpp"
#include "support/temp_dir.hpp"

using namespace hls_variants;
using hls_variants::test_support::FAKE_CLIP_BYTES;
using hls_variants::test_support::FAKE_SEGMENT_BYTES;
using hls_variants::test_support::FakeEngine;
using hls_variants::test_support::read_file;
using hls_variants::test_support::TempDir;
using hls_variants::test_support::write_file;

namespace fs = std::filesystem;

namespace {

class SegmenterTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(root.path().empty());
    write_file(root.file("clip.mp4"), "source");
    asset = make_asset_for("clip.mp4");
  }

  VideoAsset make_asset_for(const std::string &name) {
    return VideoAsset{root.file(name), name, fs::path(name).stem().string()};
  }

  VariantPaths paths_for(const char *suffix) {
    return variant_paths(root.path(), asset, *find_variant(suffix));
  }

  MediaPlaylist published(const VariantPaths &paths) {
    MediaPlaylist playlist;
    std::string error;
    EXPECT_TRUE(parse_media_playlist(read_file(paths.playlist_path),
                                     ParseMode::Strict, playlist, error))
        << error;
    return playlist;
  }

  TempDir root;
  VideoAsset asset;
};

} // anonymous namespace

// **---- Normal variants ----**

TEST_F(SegmenterTest, NormalVariantPublishesEnginePlaylist) {
  FakeEngine engine(20.0);
  const VariantSpec &spec = *find_variant("4s");
  VariantPaths paths = paths_for("4s");

  VariantError error;
  ASSERT_TRUE(build_normal_variant(engine, asset, spec, paths, error))
      << error.detail;

  EXPECT_TRUE(variant_complete(paths));
  EXPECT_FALSE(fs::exists(paths.staging_playlist_path));

  std::string text = read_file(paths.playlist_path);
  EXPECT_NE(text.find("#EXT-X-TARGETDURATION:4\n"), std::string::npos);
  EXPECT_NE(text.find("#EXT-X-MEDIA-SEQUENCE:0\n"), std::string::npos);
  EXPECT_NE(text.find("#EXTINF:4.000000,\nsegment000.ts\n"), std::string::npos);
  EXPECT_NE(text.find("#EXT-X-ENDLIST"), std::string::npos);

  MediaPlaylist playlist = published(paths);
  EXPECT_EQ(playlist.target_duration, 4);
  ASSERT_EQ(playlist.segments.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(playlist.segments[i].uri, segment_file_name(i));
    EXPECT_TRUE(fs::exists(fs::path(paths.output_dir) / segment_file_name(i)));
  }

  auto requests = engine.segment_requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].start_number, 0);
  EXPECT_TRUE(requests[0].copy_codecs);
  EXPECT_TRUE(requests[0].retain_all_segments);
  EXPECT_DOUBLE_EQ(requests[0].seek_offset_sec, 0.0);
  EXPECT_EQ(requests[0].playlist_path, paths.staging_playlist_path);
  EXPECT_EQ(engine.clip_calls.load(), 0);
}

TEST_F(SegmenterTest, NormalVariantFailureLeavesNoPlaylist) {
  FakeEngine engine(20.0);
  engine.fail_segment_for("clip_8s/");
  VariantPaths paths = paths_for("8s");

  VariantError error;
  EXPECT_FALSE(build_normal_variant(engine, asset, *find_variant("8s"), paths,
                                    error));
  EXPECT_EQ(error.kind, ErrorKind::Encode);
  EXPECT_EQ(error.step, "segment");
  EXPECT_NE(error.detail.find("Invalid data"), std::string::npos);
  EXPECT_FALSE(variant_complete(paths));
}

TEST_F(SegmenterTest, UnwritableOutputDirIsFilesystemError) {
  /// A regular file where the variant directory's parent should be
  write_file(root.file("blocker"), "not a directory");
  VariantPaths paths =
      variant_paths(root.file("blocker"), asset, *find_variant("4s"));
  FakeEngine engine(20.0);

  VariantError error;
  EXPECT_FALSE(build_normal_variant(engine, asset, *find_variant("4s"), paths,
                                    error));
  EXPECT_EQ(error.kind, ErrorKind::Filesystem);
  EXPECT_EQ(error.step, "prepare");
  EXPECT_STREQ(error_kind_name(error.kind), "filesystem");
  EXPECT_EQ(engine.segment_calls.load(), 0);
  EXPECT_FALSE(variant_complete(paths));
}

// **---- Fast-start variants ----**

TEST_F(SegmenterTest, FastStartSplicesLeadInBeforeRemainder) {
  FakeEngine engine(20.0);
  const VariantSpec &spec = *find_variant("1s_fast");
  VariantPaths paths = paths_for("1s_fast");

  VariantError error;
  ASSERT_TRUE(build_fast_start_variant(engine, asset, spec, paths, error))
      << error.detail;

  std::string text = read_file(paths.playlist_path);
  EXPECT_EQ(text.rfind("#EXTM3U\n", 0), 0u);
  EXPECT_NE(text.find("#EXT-X-TARGETDURATION:1\n"), std::string::npos);
  EXPECT_NE(text.find("#EXT-X-MEDIA-SEQUENCE:0\n"), std::string::npos);
  EXPECT_NE(text.find("#EXTINF:1.000000,\nsegment000.ts\n"), std::string::npos);

  MediaPlaylist playlist = published(paths);
  ASSERT_EQ(playlist.segments.size(), 20u);
  for (size_t i = 0; i < playlist.segments.size(); ++i) {
    EXPECT_EQ(playlist.segments[i].uri, segment_file_name(static_cast<int>(i)));
  }
  EXPECT_TRUE(playlist.end_list);

  /// Lead-in is the degraded clip, the rest are codec-copy segments
  EXPECT_EQ(fs::file_size(paths.lead_in_segment_path), FAKE_CLIP_BYTES);
  EXPECT_EQ(fs::file_size(fs::path(paths.output_dir) / "segment001.ts"),
            FAKE_SEGMENT_BYTES);
  EXPECT_LT(fs::file_size(paths.lead_in_segment_path),
            fs::file_size(fs::path(paths.output_dir) / "segment001.ts"));
  EXPECT_FALSE(fs::exists(paths.staging_playlist_path));

  auto clips = engine.clip_requests();
  ASSERT_EQ(clips.size(), 1u);
  EXPECT_DOUBLE_EQ(clips[0].clip_length_sec, 1.0);
  EXPECT_EQ(clips[0].output_path, paths.lead_in_segment_path);

  auto segments = engine.segment_requests();
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].start_number, 1);
  EXPECT_DOUBLE_EQ(segments[0].seek_offset_sec, 1.0);
  EXPECT_TRUE(segments[0].copy_codecs);
}

TEST_F(SegmenterTest, FastStartLeadInFailureLeavesNoPlaylist) {
  FakeEngine engine(20.0);
  engine.fail_clip_for("clip_4s_fast/");
  VariantPaths paths = paths_for("4s_fast");

  VariantError error;
  EXPECT_FALSE(build_fast_start_variant(engine, asset, *find_variant("4s_fast"),
                                        paths, error));
  EXPECT_EQ(error.kind, ErrorKind::Encode);
  EXPECT_EQ(error.step, "lead-in");
  EXPECT_FALSE(variant_complete(paths));
  EXPECT_EQ(engine.segment_calls.load(), 0);
}

TEST_F(SegmenterTest, FastStartTimeoutIsReported) {
  FakeEngine engine(20.0);
  engine.time_out_clips(true);
  VariantPaths paths = paths_for("8s_fast");

  VariantError error;
  EXPECT_FALSE(build_fast_start_variant(engine, asset, *find_variant("8s_fast"),
                                        paths, error));
  EXPECT_EQ(error.kind, ErrorKind::Timeout);
  EXPECT_EQ(error.step, "lead-in");
  EXPECT_FALSE(variant_complete(paths));
}

TEST_F(SegmenterTest, FastStartRequiresLeadInFile) {
  FakeEngine engine(20.0);
  engine.skip_clip_output(true);
  VariantPaths paths = paths_for("500ms_fast");

  VariantError error;
  EXPECT_FALSE(build_fast_start_variant(
      engine, asset, *find_variant("500ms_fast"), paths, error));
  EXPECT_EQ(error.step, "lead-in");
  EXPECT_FALSE(variant_complete(paths));
}

TEST_F(SegmenterTest, FastStartRemainderFailureLeavesNoPlaylist) {
  FakeEngine engine(20.0);
  engine.fail_segment_for("clip_12s_fast/");
  VariantPaths paths = paths_for("12s_fast");

  VariantError error;
  EXPECT_FALSE(build_fast_start_variant(
      engine, asset, *find_variant("12s_fast"), paths, error));
  EXPECT_EQ(error.step, "remainder");
  EXPECT_FALSE(variant_complete(paths));

  /// The lead-in stays behind but does not count as completion
  EXPECT_TRUE(fs::exists(paths.lead_in_segment_path));
}

TEST_F(SegmenterTest, FastStartRejectsUnexpectedRemainderTags) {
  FakeEngine engine(20.0);
  engine.inject_remainder_tag("#EXT-X-DISCONTINUITY");
  VariantPaths paths = paths_for("4s_fast");

  VariantError error;
  EXPECT_FALSE(build_fast_start_variant(engine, asset, *find_variant("4s_fast"),
                                        paths, error));
  EXPECT_EQ(error.kind, ErrorKind::PlaylistSynthesis);
  EXPECT_EQ(error.step, "synthesis");
  EXPECT_NE(error.detail.find("#EXT-X-DISCONTINUITY"), std::string::npos)
      << error.detail;
  EXPECT_FALSE(variant_complete(paths));
}

TEST_F(SegmenterTest, FastStartRebuildsOverStaleLeadIn) {
  FakeEngine engine(20.0);
  VariantPaths paths = paths_for("8s_fast");

  /// Interrupted earlier run: lead-in written, playlist never published
  fs::create_directories(paths.output_dir);
  write_file(paths.lead_in_segment_path, "stale");
  ASSERT_FALSE(variant_complete(paths));

  VariantError error;
  ASSERT_TRUE(build_fast_start_variant(engine, asset, *find_variant("8s_fast"),
                                       paths, error))
      << error.detail;
  EXPECT_EQ(engine.clip_calls.load(), 1);
  EXPECT_EQ(fs::file_size(paths.lead_in_segment_path), FAKE_CLIP_BYTES);

  MediaPlaylist playlist = published(paths);
  EXPECT_EQ(playlist.target_duration, 8);
  ASSERT_EQ(playlist.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(playlist.segments[0].duration, 8.0);
  EXPECT_DOUBLE_EQ(playlist.segments[2].duration, 4.0);
}

TEST_F(SegmenterTest, FastStartShortSourceHoldsLeadInOnly) {
  FakeEngine engine(0.8);
  VariantPaths paths = paths_for("1s_fast");

  VariantError error;
  ASSERT_TRUE(build_fast_start_variant(engine, asset, *find_variant("1s_fast"),
                                       paths, error))
      << error.detail;
  EXPECT_EQ(engine.segment_calls.load(), 0);

  MediaPlaylist playlist = published(paths);
  ASSERT_EQ(playlist.segments.size(), 1u);
  EXPECT_EQ(playlist.segments[0].uri, "segment000.ts");
}

TEST_F(SegmenterTest, FastStartUnknownDurationStillSegmentsRemainder) {
  FakeEngine engine(20.0);
  engine.set_probe_result(-1.0);
  VariantPaths paths = paths_for("12s_fast");

  VariantError error;
  ASSERT_TRUE(build_fast_start_variant(engine, asset, *find_variant("12s_fast"),
                                       paths, error))
      << error.detail;
  EXPECT_EQ(engine.segment_calls.load(), 1);
  EXPECT_EQ(published(paths).segments.size(), 2u);
}

// **---- Splicing ----**

TEST(FastStartSynthesis, RejectsGapInRemainder) {
  MediaPlaylist remainder;
  remainder.segments.push_back({4.0, "", "segment001.ts"});
  remainder.segments.push_back({4.0, "", "segment003.ts"});
  remainder.end_list = true;

  MediaPlaylist playlist;
  std::string error;
  EXPECT_FALSE(synthesize_fast_start_playlist(remainder, *find_variant("4s_fast"),
                                              playlist, error));
  EXPECT_NE(error.find("segment003.ts"), std::string::npos) << error;
}

TEST(FastStartSynthesis, RejectsRemainderStartingAtZero) {
  MediaPlaylist remainder;
  remainder.segments.push_back({4.0, "", "segment000.ts"});

  MediaPlaylist playlist;
  std::string error;
  EXPECT_FALSE(synthesize_fast_start_playlist(remainder, *find_variant("4s_fast"),
                                              playlist, error));
}

TEST(FastStartSynthesis, LeadInUsesVariantDuration) {
  MediaPlaylist remainder;
  remainder.segments.push_back({0.5, "", "segment001.ts"});
  remainder.segments.push_back({0.3, "", "segment002.ts"});

  MediaPlaylist playlist;
  std::string error;
  ASSERT_TRUE(synthesize_fast_start_playlist(
      remainder, *find_variant("500ms_fast"), playlist, error))
      << error;
  EXPECT_EQ(playlist.target_duration, 1);
  EXPECT_EQ(playlist.media_sequence, 0);
  EXPECT_TRUE(playlist.end_list);
  ASSERT_EQ(playlist.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(playlist.segments[0].duration, 0.5);
  EXPECT_EQ(playlist.segments[0].uri, "segment000.ts");
  EXPECT_DOUBLE_EQ(playlist.segments[2].duration, 0.3);
}
