#include <peek/app/worker_pool.hpp>
#include <peek/core/logging.hpp>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace peek::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

WorkerPool::WorkerPool(WorkerPoolConfig config, JobHandler handler)
    : handler_(std::move(handler)) {
  if (!handler_) throw std::invalid_argument("WorkerPool: handler is required");
  const std::size_t workers = effective_workers(config.worker_count);
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::enqueue(std::string job_id) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return false;
    if (!active_.insert(job_id).second) return false;
    queue_.push_back(std::move(job_id));
  }
  work_cv_.notify_one();
  return true;
}

void WorkerPool::wait_idle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this]() { return queue_.empty() && in_flight_ == 0; });
}

std::vector<std::string> WorkerPool::shutdown() {
  std::vector<std::string> dropped;
  {
    std::lock_guard lock(mutex_);
    if (stopping_ && threads_.empty()) return dropped;
    stopping_ = true;
    dropped.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
    for (const auto& id : dropped) active_.erase(id);
  }
  work_cv_.notify_all();
  idle_cv_.notify_all();

  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  return dropped;
}

std::size_t WorkerPool::pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size() + in_flight_;
}

void WorkerPool::worker_loop() {
  while (true) {
    std::string job_id;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) break;
      job_id = std::move(queue_.front());
      queue_.pop_front();
      ++in_flight_;
    }

    try {
      handler_(job_id);
    } catch (const std::exception& e) {
      peek::core::logger()->error("worker: job {} raised: {}", job_id, e.what());
    }

    {
      std::lock_guard lock(mutex_);
      --in_flight_;
      active_.erase(job_id);
    }
    idle_cv_.notify_all();
  }
}

}  // namespace peek::app
