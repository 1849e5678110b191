/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink shared by the request and reconciliation boundaries.
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace deskctl {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::faultCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return faults_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++faults_;
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        if (seen_.size() > kHistory)
          seen_.pop_front();
        cb = escalation_;
      }
      // called outside the lock so the callback may log freely
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace deskctl
