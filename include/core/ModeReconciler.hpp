#pragma once
/** @file  ModeReconciler.hpp
 *  @brief Single-flight state machine converging the desktop to the requested mode.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// deskctl headers
#include "core/Mode.hpp"
#include "core/StackStatus.hpp"

namespace deskctl {
  namespace core {

    class ErrorMonitor;
    class Logger;
    class ModeApplicator;
    class ReadinessProber;
    class SupervisorClient;

    /// Advisory view of the stack; read without the switch lock.
    struct StatusReport {
      std::map<std::string, std::string> services; ///< required services only
      bool running{ true };
      StackHealth health{ StackHealth::Unknown };
      double lastSwitchTs{ 0.0 };
      double lastApplyTs{ 0.0 };
      Mode currentMode{ Mode::Unknown };
      std::string kioskScript;
      std::string wmService;
      std::string desktopService;
    };

    /// Result of one `ensureMode()` call, mapped 1:1 onto the HTTP reply.
    struct EnsureOutcome {
      int httpStatus{ 202 };
      bool ok{ false };
      bool busy{ false };
      bool changed{ false }; ///< stack was (re)started by this call
      bool applied{ false }; ///< toggle was invoked by this call
      bool modeOk{ false };
      Mode requestedMode{ Mode::Unknown };
      std::string modeMessage;
      std::string message; ///< ready | starting | applying | switch_in_progress | error
      bool fault{ false };
      std::string error;
      StatusReport status;
    };

    /**
 * @class ModeReconciler
 * @brief Owns ModeState (current mode + timestamps) and the switch lock.
 *
 *  * `ensureMode()` never blocks on the lock: a second caller gets `busy`.
 *  * The toggle runs only on force, after a (re)start, or when the
 *    remembered mode differs from the requested one.
 *  * `currentMode` changes only after a successful toggle.
 *  * Never throws; internal faults come back as a 500 outcome.
 */
    class ModeReconciler {
    public:
      ModeReconciler(SupervisorClient& supervisor, ReadinessProber& prober, ModeApplicator& applicator,
                     std::chrono::milliseconds settleDelay, Logger& log, std::shared_ptr<ErrorMonitor> errors);

      //---public APIs------------------------------------------------------
      EnsureOutcome ensureMode(bool force, bool wantKiosk);

      /// Unconditional stop+start of every service; does not touch ModeState.
      /// @returns the stack-wait result
      bool restartStack();

      StatusReport statusReport();

      Mode currentMode() const { return currentMode_.load(); }
      double lastSwitchTs() const { return lastSwitchTs_.load(); }
      double lastApplyTs() const { return lastApplyTs_.load(); }

      ModeReconciler(const ModeReconciler&) = delete;
      ModeReconciler& operator=(const ModeReconciler&) = delete;

    private:
      EnsureOutcome reconcile(bool force, Mode desired); ///< caller holds switchLock_
      EnsureOutcome busyOutcome(Mode desired);
      StatusReport reportFrom(const StatusSnapshot& snapshot) const;

      static double nowEpochSeconds();

      SupervisorClient& supervisor_;
      ReadinessProber& prober_;
      ModeApplicator& applicator_;
      std::chrono::milliseconds settleDelay_;
      Logger& log_;
      std::shared_ptr<ErrorMonitor> errors_;

      std::mutex switchLock_; ///< try_lock only
      std::atomic<Mode> currentMode_{ Mode::Unknown };
      std::atomic<double> lastApplyTs_{ 0.0 };
      std::atomic<double> lastSwitchTs_{ 0.0 };
    };

  } // namespace core
} // namespace deskctl
