/**
 * @file task_queue.hpp
 * @brief Blocking work queue and first-error collection for worker pools
 *
 * @details WorkQueue<T> is shared by both pools in the project:
 *
 *          - Mask workers pop MaskTask frame indices of one job
 *
 *          - Export workers pop accepted ExportJobs in submission order
 *
 *          ErrorCollector keeps the first failure any mask worker reports.
 */

#ifndef KEYCROP_TASK_QUEUE_HPP
#define KEYCROP_TASK_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

#include "error.hpp"

namespace keycrop {

/**
 * @class WorkQueue
 * @brief FIFO hand-off between producers and a fixed set of workers.
 *
 * @attention LIFECYCLE:
 *
 * - push() until all work is known, then finish(); workers drain what is
 *   left and pop() returns false once the queue is empty
 *
 * - cancel() drops pending items so workers exit promptly
 */
template <typename T> class WorkQueue {
  std::deque<T> items_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool closed_ = false;

public:
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
  }

  /**
   * @brief Take the oldest item, blocking while the queue is open and empty.
   * @return false once the queue is closed and drained
   */
  bool pop(T &out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !items_.empty() || closed_; });
    if (items_.empty())
      return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  /// No more pushes; wake every waiting worker
  void finish() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  /// Discard pending items and finish
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.clear();
      closed_ = true;
    }
    cv_.notify_all();
  }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }
};

/// One output frame whose mask must be rendered and written
struct MaskTask {
  int frame_index = 0;
};

/**
 * @class ErrorCollector
 * @brief Thread-safe record of the first worker failure.
 */
class ErrorCollector {
  ErrorCode first_ = ErrorCode::Ok;
  int frame_ = -1;
  mutable std::mutex mutex_;

public:
  /// Record an error; later errors are ignored
  void report(ErrorCode code, int frame);

  bool failed() const;
  ErrorCode first() const;
  int frame() const;
};

} // namespace keycrop

#endif // KEYCROP_TASK_QUEUE_HPP
