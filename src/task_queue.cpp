/**
 * @file task_queue.cpp
 * @brief ErrorCollector implementation
 */

#include "keycrop/task_queue.hpp"

namespace keycrop {

void ErrorCollector::report(ErrorCode code, int frame) {
  if (ok(code))
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (ok(first_)) {
    first_ = code;
    frame_ = frame;
  }
}

bool ErrorCollector::failed() const { return !ok(first()); }

ErrorCode ErrorCollector::first() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return first_;
}

int ErrorCollector::frame() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frame_;
}

} // namespace keycrop
