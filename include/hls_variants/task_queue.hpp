/**
 * @file task_queue.hpp
 * @brief Thread-safe job queue, output claims and result collection
 *
 * @details Provides:
 *          - JobQueue: shared queue of asset x variant jobs for the workers
 *
 *          - ClaimTable: at most one worker per output directory, so the
 *            probe-then-build sequence of a variant is atomic
 *
 *          - ResultCollector: per-job result slots filled by workers
 */

#ifndef HLS_VARIANTS_TASK_QUEUE_HPP
#define HLS_VARIANTS_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <vector>

#include "types.hpp"

namespace hls_variants {

/**
 * @struct VariantJob
 * @brief One asset x variant unit of work.
 */
struct VariantJob {
  size_t index;       //< Position in catalog order, for the report
  VideoAsset asset;   //< Source
  VariantSpec spec;   //< Catalog entry
  VariantPaths paths; //< Output layout
};

/**
 * @class JobQueue
 * @brief FIFO of jobs; workers pop in catalog order.
 */
class JobQueue {
  std::queue<VariantJob> jobs;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a job to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(VariantJob job);

  /**
   * @brief Pop a job from the queue.
   * @note Blocks until a job is available or queue is finished.
   * @param job Output parameter for the job
   * @return true if a job was retrieved, false if queue is empty and done
   */
  bool pop(VariantJob &job);

  /**
   * @brief Signal that no more jobs will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

/**
 * @class ClaimTable
 * @brief Exclusive claims keyed by output directory.
 * @note Two assets with the same base name resolve to the same directories;
 *       the second claimant waits, re-probes and finds the variant built.
 */
class ClaimTable {
  std::set<std::string> claimed;
  std::mutex mutex;
  std::condition_variable cv;

public:
  /// Block until @p key is free, then take it
  void acquire(const std::string &key);

  /// Release @p key and wake waiters
  void release(const std::string &key);
};

/**
 * @class ClaimGuard
 * @brief RAII holder of one ClaimTable entry.
 */
class ClaimGuard {
  ClaimTable &table_;
  std::string key_;

public:
  ClaimGuard(ClaimTable &table, std::string key);
  ~ClaimGuard();

  ClaimGuard(const ClaimGuard &) = delete;
  ClaimGuard &operator=(const ClaimGuard &) = delete;
};

/**
 * @class ResultCollector
 * @brief Thread-safe slots for per-job results.
 */
class ResultCollector {
  std::vector<VariantResult> results;
  std::mutex mutex;

public:
  /// Allocate one slot per job
  explicit ResultCollector(size_t job_count);

  /// Store the result of job @p index
  void set(size_t index, VariantResult &&result);

  /**
   * @brief Extract all collected results.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<VariantResult> extract();
};

} // namespace hls_variants

#endif // HLS_VARIANTS_TASK_QUEUE_HPP
