/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault fan-in for the decode pipeline
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// axostim headers
#include "core/ErrorMonitor.hpp"

using namespace axostim::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

std::vector<std::string> ErrorMonitor::failures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_.size();
}

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    seen_.push_back(message);
    cb = escalation_;
  }
  // escalate outside the lock so the callback may query us
  if (cb)
    cb(message);
}
