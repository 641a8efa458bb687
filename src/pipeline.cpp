/**
 * @file pipeline.cpp
 * @brief Variant generation orchestration implementation
 *
 * @details Implements the VariantPipeline:
 *
 *          - Uploads root creation and asset scanning
 *
 *          - Job queue in asset x catalog order
 *
 *          - Worker threads with per-output-directory claims
 *
 *          - Per-variant result collection and summary output
 *
 * @note When more than one worker runs, log lines are prefixed with
 *       [Worker N].
 */

#include "hls_variants/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "hls_variants/asset_scanner.hpp"
#include "hls_variants/completion_prober.hpp"
#include "hls_variants/config.hpp"
#include "hls_variants/fast_start_synthesizer.hpp"
#include "hls_variants/logging.hpp"
#include "hls_variants/normal_segmenter.hpp"
#include "hls_variants/system.hpp"
#include "hls_variants/variant_catalog.hpp"

namespace hls_variants {

namespace fs = std::filesystem;

namespace {

/// First non-empty line of engine diagnostics
std::string first_line(const std::string &text) {
  size_t begin = text.find_first_not_of('\n');
  if (begin == std::string::npos)
    return "";
  return text.substr(begin, text.find('\n', begin) - begin);
}

} // anonymous namespace

// **---- Options / Report ----**

PipelineOptions PipelineOptions::from_config() {
  PipelineOptions options;
  options.workers = Config::parallel_variants();
  options.fail_fast = Config::fail_fast();
  return options;
}

int PipelineReport::count(VariantOutcome outcome) const {
  return static_cast<int>(
      std::count_if(results.begin(), results.end(),
                    [outcome](const VariantResult &r) {
                      return r.outcome == outcome;
                    }));
}

bool PipelineReport::ok() const {
  return scan_error.kind == ErrorKind::None &&
         count(VariantOutcome::Failed) == 0;
}

// **---- Constructor ----**

VariantPipeline::VariantPipeline(TranscodeEngine &engine,
                                 PipelineOptions options)
    : engine_(engine), options_(options) {}

// **---- Logging Helpers ----**

void VariantPipeline::log_info(int worker_id, const std::string &msg) {
  if (worker_id >= 0) {
    LOG_INFO("[Worker {}] {}", worker_id, msg);
  } else {
    LOG_INFO("{}", msg);
  }
}

// **---- Main Processing ----**

PipelineReport VariantPipeline::run(const std::string &uploads_root) {
  PipelineReport report;
  report.uploads_root = uploads_root;
  abort_.store(false);

  LOG_PHASE("============================================================");
  LOG_PHASE("Checking uploads directory for videos...");
  LOG_PHASE("============================================================");

  // **----- PHASE 0: UPLOADS ROOT -----**

  std::error_code ec;
  bool root_exists = fs::exists(uploads_root, ec);
  if (ec) {
    report.scan_error = {ErrorKind::Scan, "scan",
                         fmt::format("cannot stat {}: {}", uploads_root,
                                     ec.message())};
    LOG_ERROR("{}", report.scan_error.detail);
    return report;
  }
  if (!root_exists) {
    std::string error;
    if (!ensure_directory(uploads_root, error)) {
      report.scan_error = {ErrorKind::Scan, "scan", error};
      LOG_ERROR("{}", error);
      return report;
    }
    report.created_root = true;
    LOG_INFO("Created uploads directory {}", uploads_root);
    LOG_INFO("No videos found to process.");
    return report;
  }

  // **----- PHASE 1: SCAN -----**

  std::vector<VideoAsset> assets;
  std::string error;
  TIMER_START(scan);
  bool scanned = scan_assets(uploads_root, assets, error);
  TIMER_END(scan);
  if (!scanned) {
    report.scan_error = {ErrorKind::Scan, "scan", error};
    LOG_ERROR("{}", error);
    return report;
  }
  report.asset_count = assets.size();

  if (assets.empty()) {
    LOG_INFO("No videos found in uploads directory.");
    return report;
  }

  LOG_INFO("Found {} video(s) to process:", assets.size());
  for (size_t i = 0; i < assets.size(); ++i) {
    LOG_INFO("  {}. {}", i + 1, assets[i].file_name);
  }

  // **----- PHASE 2: JOBS -----**

  const auto &catalog = variant_catalog();
  const size_t total = assets.size() * catalog.size();
  ResultCollector results(total);
  JobQueue queue;
  size_t queued = 0;

  for (size_t a = 0; a < assets.size(); ++a) {
    const VideoAsset &asset = assets[a];
    bool complete = asset_complete(uploads_root, asset);
    if (complete) {
      LOG_INFO("Video {} already processed (all variants exist). Skipping...",
               asset.file_name);
    }

    for (size_t v = 0; v < catalog.size(); ++v) {
      VariantJob job{a * catalog.size() + v, asset, catalog[v],
                     variant_paths(uploads_root, asset, catalog[v])};
      if (complete) {
        VariantResult skipped;
        skipped.asset_name = asset.file_name;
        skipped.suffix = job.spec.suffix;
        skipped.playlist_path = job.paths.playlist_path;
        skipped.outcome = VariantOutcome::Skipped;
        results.set(job.index, std::move(skipped));
        continue;
      }
      queue.push(std::move(job));
      ++queued;
    }
  }
  queue.finish();

  // **----- PHASE 3: WORKERS -----**

  int num_workers = options_.workers;
  if (num_workers <= 0) {
    num_workers = detect_cpu_limit();
  }
  num_workers = std::min(num_workers, detect_cpu_limit());
  num_workers = std::min(num_workers, static_cast<int>(queued));
  num_workers = std::max(1, num_workers);
  report.workers = num_workers;

  if (queued > 0) {
    LOG_INFO("Variants to check: {} ({} worker{}, {})", queued, num_workers,
             num_workers == 1 ? "" : "s",
             options_.fail_fast ? "fail-fast" : "failures isolated");

    if (num_workers == 1) {
      worker(-1, &queue, &results);
    } else {
      std::vector<std::thread> workers;
      for (int i = 0; i < num_workers; ++i) {
        workers.emplace_back(&VariantPipeline::worker, this, i, &queue,
                             &results);
      }
      for (auto &w : workers) {
        w.join();
      }
    }
  }

  report.results = results.extract();
  return report;
}

void VariantPipeline::worker(int worker_id, JobQueue *queue,
                             ResultCollector *results) {
  VariantJob job;
  while (queue->pop(job)) {
    VariantResult result = process_job(worker_id, job);
    results->set(job.index, std::move(result));
  }
  if (worker_id >= 0) {
    log_info(worker_id, "Finished (no more variants)");
  }
}

VariantResult VariantPipeline::process_job(int worker_id,
                                           const VariantJob &job) {
  VariantResult result;
  result.asset_name = job.asset.file_name;
  result.suffix = job.spec.suffix;
  result.playlist_path = job.paths.playlist_path;

  if (abort_.load()) {
    result.outcome = VariantOutcome::Cancelled;
    log_info(worker_id, fmt::format("{} {}: cancelled after earlier failure",
                                    job.asset.file_name, job.spec.suffix));
    return result;
  }

  /// Claim before probing: another worker may be building this directory
  ClaimGuard claim(claims_,
                   fs::path(job.paths.output_dir).lexically_normal().string());

  if (variant_complete(job.paths)) {
    result.outcome = VariantOutcome::Skipped;
    log_info(worker_id, fmt::format("{} variant of {} already exists, skipping...",
                                    job.spec.suffix, job.asset.file_name));
    return result;
  }

  LOG_PHASE("------------------------------------------------------------");
  log_info(worker_id, fmt::format("Processing {} -> {}", job.asset.file_name,
                                  variant_dir_name(job.asset, job.spec)));

  auto start_time = std::chrono::steady_clock::now();

  VariantError error;
  bool ok = job.spec.fast_start
                ? build_fast_start_variant(engine_, job.asset, job.spec,
                                           job.paths, error)
                : build_normal_variant(engine_, job.asset, job.spec, job.paths,
                                       error);

  auto end_time = std::chrono::steady_clock::now();
  result.processing_time_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                            start_time)
          .count();
  TimingCollector::record(variant_dir_name(job.asset, job.spec),
                          result.processing_time_us);

  if (ok) {
    result.outcome = VariantOutcome::Built;
    if (worker_id >= 0) {
      LOG_SUCCESS("[Worker {}] Completed: {} ({:.1f}s)", worker_id,
                  job.paths.playlist_path,
                  result.processing_time_us / 1000000.0);
    } else {
      LOG_SUCCESS("Completed: {} ({:.1f}s)", job.paths.playlist_path,
                  result.processing_time_us / 1000000.0);
    }
    return result;
  }

  result.outcome = VariantOutcome::Failed;
  result.error = error;
  LOG_ERROR("Failed to build {} for {} at step '{}' ({}): {}", job.spec.suffix,
            job.asset.file_name, error.step, error_kind_name(error.kind),
            error.detail);

  if (options_.fail_fast) {
    abort_.store(true);
  }
  return result;
}

// **---- Summary ----**

void print_report(const PipelineReport &report, double wall_clock_sec) {
  int built = report.count(VariantOutcome::Built);
  int skipped = report.count(VariantOutcome::Skipped);
  int failed = report.count(VariantOutcome::Failed);
  int cancelled = report.count(VariantOutcome::Cancelled);

  long total_time_us = 0;
  for (const auto &result : report.results) {
    total_time_us += result.processing_time_us;
  }
  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=============== VARIANT GENERATION SUMMARY ===============\n");
  fmt::print("{:<25} {:>30}\n", "Uploads root:", report.uploads_root);
  fmt::print("{:<25} {:>30}\n", "Videos:", report.asset_count);
  fmt::print("{:<25} {:>30}\n", "Variants built:", built);
  fmt::print("{:<25} {:>30}\n", "Variants skipped:", skipped);
  fmt::print("{:<25} {:>30}\n", "Variants failed:", failed);
  fmt::print("{:<25} {:>30}\n", "Variants cancelled:", cancelled);
  fmt::print("{:<25} {:>30}\n", "Workers:", report.workers);
  fmt::print("{:<25} {:>30}\n", "Wall-clock time:", format_time(wall_clock_sec));
  fmt::print("{:<25} {:>29.1f}s\n", "Sum of build times:", sum_time_sec);
  fmt::print("{:<25} {:>29.2f}x\n", "Speedup:", speedup);
  fmt::print(fg(fmt::color::cyan),
             "==========================================================\n");

  /// Skipped variants are omitted: on a warm root they are all of them
  if (built + failed + cancelled > 0) {
    fmt::print("\n{:<30} {:<12} {:>10}\n", "Variant", "Outcome", "Time");
    fmt::print("{:-<30} {:-<12} {:-<10}\n", "", "", "");
    for (const auto &r : report.results) {
      if (r.outcome == VariantOutcome::Skipped)
        continue;
      std::string name = fmt::format("{}:{}", r.asset_name, r.suffix);
      fmt::print("{:<30} {:<12} {:>9.1f}s\n", name, outcome_name(r.outcome),
                 r.processing_time_us / 1000000.0);
    }
  }

  if (report.scan_error.kind != ErrorKind::None) {
    fmt::print(fg(fmt::color::red), "\nScan failed: {}\n",
               report.scan_error.detail);
  }

  /// List failed variants with the first line of their diagnostics
  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed variants:\n");
    for (const auto &r : report.results) {
      if (r.outcome != VariantOutcome::Failed)
        continue;
      fmt::print(fg(fmt::color::red), "  - {} [{}] step '{}' ({}): {}\n",
                 r.asset_name, r.suffix, r.error.step,
                 error_kind_name(r.error.kind), first_line(r.error.detail));
    }
  }

  if (report.ok() && report.asset_count > 0) {
    fmt::print(fg(fmt::color::green), "\nAll videos processed successfully!\n");
  }
  std::fflush(stdout);
}

} // namespace hls_variants
