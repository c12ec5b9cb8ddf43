#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace stratexec {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A closable FIFO queue shared between threads. Provides a
// blocking pop() that returns once an item is available or the queue has
// been closed, and a non-blocking try_pop().
//
// Used by RpcServer for replies: workers push encoded replies, and the
// socket thread drains them with try_pop() and sends them.
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods are thread-safe. close() wakes every blocked consumer.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends one item and wakes one waiting consumer.
  //
  // @return false if the queue has been closed; the item is dropped.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // @brief  Removes and returns the front item, waiting while the queue is
  //         empty and open.
  //
  // @return The front item, or std::nullopt once the queue is closed and
  //         drained. Items pushed before close() are still delivered.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // @return The front item if one is present, otherwise std::nullopt.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // @brief  Rejects further pushes and releases every blocked pop().
  //
  // Idempotent. Consumers keep receiving already-queued items until the
  // queue is empty, then pop() returns std::nullopt.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Snapshot only; another thread may push or pop immediately after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace stratexec
