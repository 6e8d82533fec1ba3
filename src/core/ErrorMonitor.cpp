/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace ivbench {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard lock(mtx_);
        ++notifications_;
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // outside the lock: the callback may log, and logging may notify back
      if (cb)
        cb(message);
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard lock(mtx_);
      return seen_;
    }

    std::size_t ErrorMonitor::notificationCount() const {
      std::lock_guard lock(mtx_);
      return notifications_;
    }

  } // namespace core
} // namespace ivbench
