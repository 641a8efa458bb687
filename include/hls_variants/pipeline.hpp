/**
 * @file pipeline.hpp
 * @brief Variant generation orchestration
 *
 * @details The VariantPipeline drives one generation run over an uploads
 *          root:
 *
 *          1. Ensure the root exists (a freshly created root means nothing
 *             to do)
 *
 *          2. Scan for video assets
 *
 *          3. Queue one job per asset x catalog entry, in catalog order
 *
 *          4. Workers claim each output directory, re-probe completion and
 *             dispatch to the normal or fast-start builder
 *
 *          5. Collect a per-variant report
 *
 * @note With one worker (the default) the run is strictly sequential: one
 *       engine process at a time, assets and variants in discovery order.
 */

#ifndef HLS_VARIANTS_PIPELINE_HPP
#define HLS_VARIANTS_PIPELINE_HPP

#include <atomic>
#include <string>
#include <vector>

#include "task_queue.hpp"
#include "transcode_engine.hpp"
#include "types.hpp"

namespace hls_variants {

/**
 * @struct PipelineOptions
 * @brief Scheduling and failure policy for a run.
 */
struct PipelineOptions {
  int workers = 1;        //< Parallel variant builds (0 = CPU limit)
  bool fail_fast = false; //< Cancel unstarted jobs after the first failure

  /// Options from PARALLEL_VARIANTS / FAIL_FAST
  static PipelineOptions from_config();
};

/**
 * @struct PipelineReport
 * @brief Structured outcome of a run; the caller decides what is fatal.
 */
struct PipelineReport {
  std::string uploads_root;
  bool created_root = false; //< Root did not exist and was created
  VariantError scan_error;   //< kind == Scan when the root was unreadable
  size_t asset_count = 0;
  int workers = 0;
  std::vector<VariantResult> results; //< Catalog order per asset

  int count(VariantOutcome outcome) const;

  /// No scan error and no failed variant
  bool ok() const;
};

/**
 * @class VariantPipeline
 * @brief Orchestrates variant generation with a bounded worker pool.
 *
 * @attention CONCURRENCY:
 *
 *   - Workers pop jobs from a shared JobQueue
 *
 *   - A ClaimTable entry per output directory makes probe + build atomic
 *
 *   - Failures are collected; the pass/fail decision is left to the caller
 */
class VariantPipeline {
public:
  /**
   * @param engine Engine shared by all workers
   * @param options Scheduling and failure policy
   */
  VariantPipeline(TranscodeEngine &engine, PipelineOptions options);

  /**
   * @brief Run generation once over an uploads root.
   * @param uploads_root Directory holding source videos
   * @return Report with one result per asset x variant
   */
  PipelineReport run(const std::string &uploads_root);

private:
  TranscodeEngine &engine_;
  PipelineOptions options_;
  ClaimTable claims_;
  std::atomic<bool> abort_{false};

  /**
   * @brief Worker loop: pop jobs until the queue is drained.
   * @param worker_id Worker index for log prefixes (-1 = no prefix)
   */
  void worker(int worker_id, JobQueue *queue, ResultCollector *results);

  /// Probe and, if needed, build one variant
  VariantResult process_job(int worker_id, const VariantJob &job);

  void log_info(int worker_id, const std::string &msg);
};

/**
 * @brief Print the end-of-run summary table and any failures.
 * @param report Report to print
 * @param wall_clock_sec Elapsed run time in seconds
 */
void print_report(const PipelineReport &report, double wall_clock_sec);

} // namespace hls_variants

#endif // HLS_VARIANTS_PIPELINE_HPP
