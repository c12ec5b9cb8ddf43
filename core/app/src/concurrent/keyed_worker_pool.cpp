#include "stratexec/concurrent/keyed_worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace stratexec {

KeyedWorkerPool::KeyedWorkerPool(std::size_t worker_count)
    : worker_count_(std::max<std::size_t>(1, worker_count)) {}

KeyedWorkerPool::~KeyedWorkerPool() { stop(); }

void KeyedWorkerPool::start() {
  std::lock_guard lock(mutex_);
  if (!workers_.empty() || closed_) {
    return;
  }
  for (std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this] { runWorker(); });
  }
}

// -----------------------------------------------------------------------------
// submit(): append to the key's lane; a lane that was idle becomes ready
// -----------------------------------------------------------------------------
bool KeyedWorkerPool::submit(const std::string& key, Job job) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return false;
    }

    // Anonymous lanes start with "\x1f"; routing keys never do.
    std::string lane_key =
        key.empty() ? "\x1f" + std::to_string(anonymous_seq_++) : key;

    auto [it, created] = lanes_.try_emplace(lane_key);
    it->second.jobs.push_back(std::move(job));
    if (!created) {
      // Already ready or held by a worker; it will be picked up in turn.
      return true;
    }
    ready_.push_back(std::move(lane_key));
  }
  condition_.notify_one();
  return true;
}

// -----------------------------------------------------------------------------
// stop(): close, drain, join
// -----------------------------------------------------------------------------
void KeyedWorkerPool::stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    workers.swap(workers_);
  }
  condition_.notify_all();
  for (auto& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::size_t KeyedWorkerPool::activeKeys() const {
  std::lock_guard lock(mutex_);
  return lanes_.size();
}

// -----------------------------------------------------------------------------
// runWorker(): take a ready lane, run its front job, requeue or drop it
// -----------------------------------------------------------------------------
void KeyedWorkerPool::runWorker() {
  for (;;) {
    std::string key;
    Job job;
    {
      std::unique_lock lock(mutex_);
      condition_.wait(lock, [this] { return closed_ || !ready_.empty(); });
      if (ready_.empty()) {
        // Closed. Lanes still held by other workers are drained by them.
        return;
      }
      key = std::move(ready_.front());
      ready_.pop_front();
      Lane& lane = lanes_.at(key);
      job = std::move(lane.jobs.front());
      lane.jobs.pop_front();
    }

    try {
      job();
    } catch (const std::exception& e) {
      std::cerr << "[KeyedWorkerPool] job failed: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[KeyedWorkerPool] job failed: unknown exception\n";
    }

    bool requeued = false;
    {
      std::lock_guard lock(mutex_);
      auto it = lanes_.find(key);
      if (it->second.jobs.empty()) {
        lanes_.erase(it);
      } else {
        ready_.push_back(std::move(key));
        requeued = true;
      }
    }
    if (requeued) {
      condition_.notify_one();
    }
  }
}

}  // namespace stratexec
