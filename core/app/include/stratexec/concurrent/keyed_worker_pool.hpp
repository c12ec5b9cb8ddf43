#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace stratexec {

// -----------------------------------------------------------------------------
// KeyedWorkerPool
// -----------------------------------------------------------------------------
//
// @brief  Fixed pool of worker threads that runs jobs grouped by key: jobs
//         with the same key run one at a time in submission order, jobs with
//         different keys run in parallel.
//
// @details
// Each key owns a FIFO lane. A lane with pending work is "ready" exactly
// once in the ready list; a worker takes the first ready lane, runs its
// front job, then puts the lane back at the end of the ready list if more
// work is pending. A key is therefore held by at most one worker, and a
// backlog on one key never occupies more than one worker:
//
//   submit(A) x5, submit(B), 2 workers
//     worker 1: A1 ............ A2 .. A3 ..
//     worker 2: B1 (runs while A2..A5 wait in lane A)
//
// Lanes go back to the ready list at the tail, so busy keys take turns.
// An empty key means "no ordering": each such job gets a lane of its own.
//
// Thread model:
//   start() and stop() from the owning thread; submit() from any thread.
//   Jobs run on the workers and should not throw; an exception that
//   escapes a job is logged and dropped.
//
// Ownership:
//   Owns its threads and queued jobs.
// -----------------------------------------------------------------------------
class KeyedWorkerPool {
 public:
  using Job = std::function<void()>;

  explicit KeyedWorkerPool(std::size_t worker_count);

  // RAII: calls stop().
  ~KeyedWorkerPool();

  KeyedWorkerPool(const KeyedWorkerPool&) = delete;
  KeyedWorkerPool& operator=(const KeyedWorkerPool&) = delete;
  KeyedWorkerPool(KeyedWorkerPool&&) = delete;
  KeyedWorkerPool& operator=(KeyedWorkerPool&&) = delete;

  // Spawns the workers. Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // submit(key, job)
  // -------------------------------------------------------------------------
  // @return false once stop() has begun; the job is dropped.
  // -------------------------------------------------------------------------
  bool submit(const std::string& key, Job job);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Rejects new jobs, runs every job already submitted, then joins the
  // workers. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  std::size_t workerCount() const { return worker_count_; }

  // Keys with queued or running work.
  std::size_t activeKeys() const;

 private:
  struct Lane {
    std::deque<Job> jobs;
  };

  void runWorker();

  std::size_t worker_count_;

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::unordered_map<std::string, Lane> lanes_;  // guarded by mutex_
  std::deque<std::string> ready_;                // guarded by mutex_
  std::uint64_t anonymous_seq_{0};               // guarded by mutex_
  bool closed_{false};                           // guarded by mutex_

  std::vector<std::thread> workers_;
};

}  // namespace stratexec
