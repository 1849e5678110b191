#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace deskctl::core {

  /**
 * @class ErrorMonitor
 * @brief Boundaries that catch an unexpected fault call `notifyFailure()`;
 *        the registered escalation callback fires once per unique message.
 *
 * * Thread-safe (mutex-protected history).
 * * Debounces duplicate failures so a polling client hitting the same fault
 *   does not flood the log; the history keeps the last `kHistory` messages.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault (the coordinator logs it).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by request and reconciliation boundaries on an unexpected fault.
    virtual void notifyFailure(const std::string& message);

    std::size_t faultCount() const;

  private:
    static constexpr std::size_t kHistory = 64;

    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::deque<std::string> seen_; ///< de-dupe list
    std::size_t faults_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace deskctl::core
