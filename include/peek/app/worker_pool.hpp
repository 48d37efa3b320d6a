#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace peek::app {

struct WorkerPoolConfig {
  /// Number of worker threads; 0 = hardware concurrency.
  std::size_t worker_count{4};
};

/// Handler invoked on a worker thread for each job id. Exceptions are logged
/// and swallowed per job so a worker never dies.
using JobHandler = std::function<void(const std::string& job_id)>;

/// Fixed-size pool of threads draining a FIFO of job ids.
///
/// A job id is held by at most one worker: enqueue() refuses an id that is
/// already queued or being processed.
class WorkerPool {
 public:
  /// Starts the workers. Throws std::invalid_argument if handler is empty.
  WorkerPool(WorkerPoolConfig config, JobHandler handler);

  /// Calls shutdown().
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  /// False if the id is already queued or in flight, or the pool is stopped.
  bool enqueue(std::string job_id);

  /// Blocks until the queue is empty and no job is in flight.
  void wait_idle();

  /// Stops accepting work, waits for in-flight jobs and joins the workers.
  /// Jobs still queued are not run; returns their ids. Idempotent.
  std::vector<std::string> shutdown();

  /// Queued plus in-flight jobs.
  [[nodiscard]] std::size_t pending() const;

  [[nodiscard]] std::size_t worker_count() const noexcept { return threads_.size(); }

 private:
  void worker_loop();

  JobHandler handler_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<std::string> queue_;
  std::unordered_set<std::string> active_;  // queued or in flight
  std::size_t in_flight_{0};
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace peek::app
