#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace axostim::core {

  /**
 * @class ErrorMonitor
 * @brief Decoders call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector); sweeps may be decoded concurrently.
 * * Debounces duplicate failures so the host application doesn't get spammed
 *   when every sweep of a bad recording fails the same way.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a decode fault to the host application.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by decoders on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Unique failures seen so far, in arrival order.
    std::vector<std::string> failures() const;
    std::size_t failureCount() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace axostim::core
