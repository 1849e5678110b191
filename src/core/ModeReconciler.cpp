/* @file ModeReconciler.cpp
 * @brief ensureMode(): start/restart decision, readiness waits, flicker-free toggle, final verdict
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <thread>

// deskctl headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ModeApplicator.hpp"
#include "core/ModeReconciler.hpp"
#include "core/ReadinessProber.hpp"
#include "core/SupervisorClient.hpp"

using namespace deskctl::core;

namespace {
  constexpr const char* kComponent = "reconciler";
}

ModeReconciler::ModeReconciler(SupervisorClient& supervisor, ReadinessProber& prober, ModeApplicator& applicator,
                               std::chrono::milliseconds settleDelay, Logger& log,
                               std::shared_ptr<ErrorMonitor> errors)
    : supervisor_(supervisor), prober_(prober), applicator_(applicator), settleDelay_(settleDelay), log_(log),
      errors_(std::move(errors)) {
  if (!errors_)
    throw std::invalid_argument("[ModeReconciler] error monitor is nullptr");
}

double ModeReconciler::nowEpochSeconds() {
  return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

EnsureOutcome ModeReconciler::ensureMode(bool force, bool wantKiosk) {
  const Mode desired = desiredMode(wantKiosk);
  try {
    std::unique_lock<std::mutex> lock(switchLock_, std::try_to_lock);
    if (!lock.owns_lock())
      return busyOutcome(desired);
    return reconcile(force, desired);
  } catch (const std::exception& e) {
    // lock already released by unwinding
    std::string what = std::string("ensureMode(") + toString(desired) + "): " + e.what();
    errors_->notifyFailure(what);

    EnsureOutcome out;
    out.httpStatus = 500;
    out.fault = true;
    out.requestedMode = desired;
    out.message = "error";
    out.error = e.what();
    return out;
  }
}

EnsureOutcome ModeReconciler::busyOutcome(Mode desired) {
  log_.info(kComponent, std::string("switch to ") + toString(desired) + " rejected: switch in progress");
  EnsureOutcome out;
  out.httpStatus = 202;
  out.busy = true;
  out.requestedMode = desired;
  out.message = "switch_in_progress";
  out.status = statusReport();
  return out;
}

EnsureOutcome ModeReconciler::reconcile(bool force, Mode desired) {
  EnsureOutcome out;
  out.requestedMode = desired;

  // 1. is the stack up?
  const bool running = supervisor_.stackRunning(supervisor_.statusSnapshot());

  // 2. bring it up (or bounce it when forced)
  bool restarted = false;
  if (force || !running) {
    log_.info(kComponent, force ? "forced restart of desktop stack" : "desktop stack down, starting");
    // a plain start leaves services that are already RUNNING alone
    if (force)
      supervisor_.stopAll();
    supervisor_.startAll();
    bool stackUp = prober_.waitStackReady();
    restarted = true;
    lastSwitchTs_ = nowEpochSeconds();

    // supervisor RUNNING does not mean X answers yet; best-effort only
    if (stackUp)
      prober_.waitDisplayReady();
  }

  // 3. toggle only when it can change something (avoids panel flicker on polling clients)
  const bool applyNeeded = force || restarted || currentMode_.load() != desired;
  bool modeOk = true;
  std::string modeMessage = "skipped";
  if (applyNeeded) {
    ApplyResult applied = applicator_.apply(desired);
    modeOk = applied.ok;
    modeMessage = std::move(applied.message);
    if (modeOk) {
      currentMode_ = desired;
      lastApplyTs_ = nowEpochSeconds();
      if (settleDelay_.count() > 0)
        std::this_thread::sleep_for(settleDelay_);
    }
  } else {
    log_.debug(kComponent, std::string("mode already ") + toString(desired) + ", toggle skipped");
  }

  // 4. final verdict on a fresh snapshot
  out.status = statusReport();
  const bool runningNow = out.status.running;

  out.ok = runningNow && modeOk && currentMode_.load() == desired;
  out.changed = restarted;
  out.applied = applyNeeded;
  out.modeOk = modeOk;
  out.modeMessage = std::move(modeMessage);
  out.message = out.ok ? "ready" : (!runningNow ? "starting" : "applying");
  out.httpStatus = out.ok ? 200 : 202;

  if (!out.ok)
    log_.warn(kComponent, std::string("mode ") + toString(desired) + " not converged: " + out.message);
  return out;
}

bool ModeReconciler::restartStack() {
  log_.info(kComponent, "restart requested");
  supervisor_.stopAll();
  supervisor_.startAll();
  return prober_.waitStackReady();
}

StatusReport ModeReconciler::statusReport() { return reportFrom(supervisor_.statusSnapshot()); }

StatusReport ModeReconciler::reportFrom(const StatusSnapshot& snapshot) const {
  const ServiceRegistry& registry = supervisor_.registry();

  StatusReport report;
  for (const auto& name : registry.startOrder())
    report.services[name] = snapshot.stateOf(name);
  report.health = supervisor_.health(snapshot);
  report.running = isRunning(report.health);
  report.lastSwitchTs = lastSwitchTs_.load();
  report.lastApplyTs = lastApplyTs_.load();
  report.currentMode = currentMode_.load();
  report.kioskScript = applicator_.scriptPath();
  report.wmService = registry.primary();
  report.desktopService = registry.companionLabel();
  return report;
}
