/**
 * @file task_queue.cpp
 * @brief Job queue, claim table and result collection implementation
 */

#include "hls_variants/task_queue.hpp"

#include <utility>

namespace hls_variants {

// **----- JobQueue Implementation -----**

void JobQueue::push(VariantJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    jobs.push(std::move(job));
  }
  cv.notify_one();
}

bool JobQueue::pop(VariantJob &job) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !jobs.empty() || done.load(); });
  if (jobs.empty())
    return false;
  job = std::move(jobs.front());
  jobs.pop();
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- ClaimTable Implementation -----**

void ClaimTable::acquire(const std::string &key) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this, &key] { return claimed.count(key) == 0; });
  claimed.insert(key);
}

void ClaimTable::release(const std::string &key) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    claimed.erase(key);
  }
  cv.notify_all();
}

ClaimGuard::ClaimGuard(ClaimTable &table, std::string key)
    : table_(table), key_(std::move(key)) {
  table_.acquire(key_);
}

ClaimGuard::~ClaimGuard() { table_.release(key_); }

// **----- ResultCollector Implementation -----**

ResultCollector::ResultCollector(size_t job_count) : results(job_count) {}

void ResultCollector::set(size_t index, VariantResult &&result) {
  std::lock_guard<std::mutex> lock(mutex);
  if (index < results.size())
    results[index] = std::move(result);
}

std::vector<VariantResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::move(results);
}

} // namespace hls_variants
