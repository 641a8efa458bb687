/**
 * @file test_pipeline.cpp
 * @brief End-to-end orchestration tests against the fake engine
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>

#include "hls_variants/asset_scanner.hpp"
#include "hls_variants/completion_prober.hpp"
#include "hls_variants/media_playlist.hpp"
#include "hls_variants/pipeline.hpp"
#include "hls_variants/variant_catalog.hpp"
#include "support/fake_engine.hpp"
#include "support/temp_dir.hpp"

using namespace hls_variants;
using hls_variants::test_support::FakeEngine;
using hls_variants::test_support::read_file;
using hls_variants::test_support::TempDir;
using hls_variants::test_support::write_file;

namespace fs = std::filesystem;

namespace {

PipelineOptions sequential(bool fail_fast = false) {
  PipelineOptions options;
  options.workers = 1;
  options.fail_fast = fail_fast;
  return options;
}

} // anonymous namespace

TEST(Pipeline, BuildsAllVariantsOfAnAsset) {
  TempDir root;
  ASSERT_FALSE(root.path().empty());
  write_file(root.file("clip.mp4"), "source");

  FakeEngine engine(20.0);
  VariantPipeline pipeline(engine, sequential());
  PipelineReport report = pipeline.run(root.path());

  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.asset_count, 1u);
  ASSERT_EQ(report.results.size(), VARIANT_COUNT);
  EXPECT_EQ(report.count(VariantOutcome::Built), 10);

  const auto &catalog = variant_catalog();
  for (size_t i = 0; i < catalog.size(); ++i) {
    EXPECT_EQ(report.results[i].suffix, catalog[i].suffix);
    EXPECT_EQ(report.results[i].asset_name, "clip.mp4");
    ASSERT_TRUE(fs::exists(report.results[i].playlist_path));

    MediaPlaylist playlist;
    std::string error;
    ASSERT_TRUE(parse_media_playlist(read_file(report.results[i].playlist_path),
                                     ParseMode::Lenient, playlist, error))
        << error;
    EXPECT_EQ(playlist.target_duration, target_duration(catalog[i]))
        << catalog[i].suffix;
    EXPECT_EQ(playlist.media_sequence, 0) << catalog[i].suffix;
  }
  EXPECT_TRUE(asset_complete(root.path(), make_asset(root.file("clip.mp4"))));

  EXPECT_EQ(engine.segment_calls.load(), 10);
  EXPECT_EQ(engine.clip_calls.load(), 5);
}

TEST(Pipeline, SecondRunIsIdempotent) {
  TempDir root;
  write_file(root.file("clip.mp4"), "source");

  FakeEngine engine(20.0);
  VariantPipeline pipeline(engine, sequential());
  ASSERT_TRUE(pipeline.run(root.path()).ok());
  int calls_after_first_run = engine.total_calls();

  PipelineReport report = pipeline.run(root.path());
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.count(VariantOutcome::Skipped), 10);
  EXPECT_EQ(engine.total_calls(), calls_after_first_run);
}

TEST(Pipeline, RebuildsOnlyMissingVariant) {
  TempDir root;
  write_file(root.file("clip.mp4"), "source");

  FakeEngine engine(20.0);
  VariantPipeline pipeline(engine, sequential());
  ASSERT_TRUE(pipeline.run(root.path()).ok());

  fs::remove(root.file("clip_4s_fast/playlist.m3u8"));
  int segment_calls = engine.segment_calls;
  int clip_calls = engine.clip_calls;

  PipelineReport report = pipeline.run(root.path());
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.count(VariantOutcome::Built), 1);
  EXPECT_EQ(report.count(VariantOutcome::Skipped), 9);
  EXPECT_EQ(report.results[5].suffix, "4s_fast");
  EXPECT_EQ(report.results[5].outcome, VariantOutcome::Built);
  EXPECT_EQ(engine.segment_calls.load(), segment_calls + 1);
  EXPECT_EQ(engine.clip_calls.load(), clip_calls + 1);
}

TEST(Pipeline, MissingRootIsCreated) {
  TempDir tmp;
  std::string root = tmp.file("uploads");

  FakeEngine engine;
  VariantPipeline pipeline(engine, sequential());
  PipelineReport report = pipeline.run(root);

  EXPECT_TRUE(report.ok());
  EXPECT_TRUE(report.created_root);
  EXPECT_TRUE(fs::is_directory(root));
  EXPECT_TRUE(report.results.empty());
  EXPECT_EQ(engine.total_calls(), 0);
}

TEST(Pipeline, EmptyRootDoesNothing) {
  TempDir root;
  write_file(root.file("readme.txt"), "not a video");

  FakeEngine engine;
  VariantPipeline pipeline(engine, sequential());
  PipelineReport report = pipeline.run(root.path());

  EXPECT_TRUE(report.ok());
  EXPECT_FALSE(report.created_root);
  EXPECT_EQ(report.asset_count, 0u);
  EXPECT_EQ(engine.total_calls(), 0);

  /// No output directories appear for non-video files
  size_t entries = 0;
  for (const auto &entry : fs::directory_iterator(root.path())) {
    EXPECT_EQ(entry.path().filename().string(), "readme.txt");
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
}

TEST(Pipeline, UnreadableRootIsAScanError) {
  TempDir tmp;
  write_file(tmp.file("uploads"), "a file, not a directory");

  FakeEngine engine;
  VariantPipeline pipeline(engine, sequential());
  PipelineReport report = pipeline.run(tmp.file("uploads"));

  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.scan_error.kind, ErrorKind::Scan);
  EXPECT_EQ(engine.total_calls(), 0);
}

TEST(Pipeline, FailuresAreIsolatedByDefault) {
  TempDir root;
  write_file(root.file("clip.mp4"), "source");

  FakeEngine engine(20.0);
  engine.fail_segment_for("clip_1s/");
  VariantPipeline pipeline(engine, sequential());
  PipelineReport report = pipeline.run(root.path());

  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.count(VariantOutcome::Failed), 1);
  EXPECT_EQ(report.count(VariantOutcome::Built), 9);

  const VariantResult &failed = report.results[2];
  EXPECT_EQ(failed.suffix, "1s");
  EXPECT_EQ(failed.outcome, VariantOutcome::Failed);
  EXPECT_EQ(failed.error.kind, ErrorKind::Encode);
  EXPECT_EQ(failed.error.step, "segment");
  EXPECT_FALSE(fs::exists(failed.playlist_path));
}

TEST(Pipeline, FailFastCancelsRemainingVariants) {
  TempDir root;
  write_file(root.file("clip.mp4"), "source");

  FakeEngine engine(20.0);
  engine.fail_segment_for("clip_1s/");
  VariantPipeline pipeline(engine, sequential(true));
  PipelineReport report = pipeline.run(root.path());

  EXPECT_FALSE(report.ok());
  ASSERT_EQ(report.results.size(), VARIANT_COUNT);
  EXPECT_EQ(report.results[0].outcome, VariantOutcome::Built);
  EXPECT_EQ(report.results[1].outcome, VariantOutcome::Built);
  EXPECT_EQ(report.results[2].outcome, VariantOutcome::Failed);
  for (size_t i = 3; i < report.results.size(); ++i) {
    EXPECT_EQ(report.results[i].outcome, VariantOutcome::Cancelled)
        << report.results[i].suffix;
    EXPECT_FALSE(fs::exists(report.results[i].playlist_path));
  }
}

TEST(Pipeline, FailedVariantIsRetriedOnNextRun) {
  TempDir root;
  write_file(root.file("clip.mp4"), "source");

  FakeEngine failing(20.0);
  failing.fail_clip_for("clip_8s_fast/");
  VariantPipeline first(failing, sequential());
  ASSERT_FALSE(first.run(root.path()).ok());

  FakeEngine healthy(20.0);
  VariantPipeline second(healthy, sequential());
  PipelineReport report = second.run(root.path());
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.count(VariantOutcome::Built), 1);
  EXPECT_EQ(healthy.clip_calls.load(), 1);
}

TEST(Pipeline, ParallelWorkersBuildEachVariantOnce) {
  TempDir root;
  write_file(root.file("a.mp4"), "source");
  write_file(root.file("b.mov"), "source");
  write_file(root.file("c.mkv"), "source");

  FakeEngine engine(20.0);
  PipelineOptions options;
  options.workers = 4;
  VariantPipeline pipeline(engine, options);
  PipelineReport report = pipeline.run(root.path());

  EXPECT_TRUE(report.ok());
  EXPECT_GE(report.workers, 1);
  EXPECT_LE(report.workers, 4);
  ASSERT_EQ(report.results.size(), 3 * VARIANT_COUNT);
  EXPECT_EQ(report.count(VariantOutcome::Built), 30);
  EXPECT_EQ(engine.segment_calls.load(), 30);
  EXPECT_EQ(engine.clip_calls.load(), 15);

  std::set<std::string> dirs;
  for (const auto &request : engine.segment_requests()) {
    dirs.insert(fs::path(request.playlist_path).parent_path().string());
  }
  EXPECT_EQ(dirs.size(), 30u);
}

TEST(Pipeline, AssetsSharingBaseNameAreBuiltOnce) {
  TempDir root;
  write_file(root.file("clip.mkv"), "source");
  write_file(root.file("clip.mp4"), "source");

  FakeEngine engine(20.0);
  PipelineOptions options;
  options.workers = 4;
  VariantPipeline pipeline(engine, options);
  PipelineReport report = pipeline.run(root.path());

  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.asset_count, 2u);
  EXPECT_EQ(report.count(VariantOutcome::Built), 10);
  EXPECT_EQ(report.count(VariantOutcome::Skipped), 10);
  EXPECT_EQ(engine.segment_calls.load(), 10);
  EXPECT_EQ(engine.clip_calls.load(), 5);
}
