/* @file SystemCoordinator.cpp
 * @brief wires settings → runner → supervisor/prober/applicator → reconciler → HTTP, and owns the lifecycle
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <csignal>
#include <stdexcept>

// deskctl headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ModeApplicator.hpp"
#include "core/ModeReconciler.hpp"
#include "core/ReadinessProber.hpp"
#include "core/ServiceRegistry.hpp"
#include "core/SupervisorClient.hpp"
#include "core/SystemCoordinator.hpp"
#include "http/ControlApi.hpp"
#include "http/ControlServer.hpp"
#include "io/ProcessRunner.hpp"

using namespace deskctl::core;

namespace {
  constexpr const char* kComponent = "coordinator";

  std::string seconds(std::chrono::milliseconds ms) {
    return std::to_string(ms.count() / 1000) + "." + std::to_string((ms.count() % 1000) / 100) + "s";
  }
} // namespace

SystemCoordinator::SystemCoordinator(Settings settings)
    : settings_(std::move(settings)), log_(std::make_unique<Logger>(settings_.logging.queueCapacity)),
      signals_(io_, SIGINT, SIGTERM) {}

SystemCoordinator::~SystemCoordinator() {
  if (log_)
    log_->stop();
}

const char* SystemCoordinator::toString(State s) {
  switch (s) {
  case State::BOOT:
    return "BOOT";
  case State::INIT:
    return "INIT";
  case State::SERVING:
    return "SERVING";
  case State::DRAINING:
    return "DRAINING";
  case State::STOPPED:
    return "STOPPED";
  case State::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

void SystemCoordinator::transitionTo(State next) {
  log_->debug(kComponent, std::string(toString(currentState_)) + " -> " + toString(next));
  currentState_ = next;
}

void SystemCoordinator::initialize() {
  transitionTo(State::INIT);
  log_->start(settings_.logging.file, settings_.logging.verbose);

  errors_ = std::make_shared<ErrorMonitor>();
  errors_->registerEscalation([this](const std::string& msg) { log_->error("fault", msg); });

  runner_ = std::make_shared<io::ProcessRunner>(settings_.display);
  registry_ = std::make_unique<ServiceRegistry>(settings_.supervisor.wmService, settings_.supervisor.desktopService);
  supervisor_ = std::make_unique<SupervisorClient>(runner_, *registry_, settings_.supervisor, *log_);
  prober_ = std::make_unique<ReadinessProber>(*supervisor_, runner_, settings_.readiness, *log_);
  applicator_ = std::make_unique<ModeApplicator>(runner_, settings_.mode, *log_);
  reconciler_ = std::make_unique<ModeReconciler>(*supervisor_, *prober_, *applicator_, settings_.mode.settleDelay,
                                                 *log_, errors_);
  api_ = std::make_unique<http::ControlApi>(*reconciler_, errors_, *log_);
  server_ = std::make_unique<http::ControlServer>(io_, *api_, settings_.server, *log_);

  logSettings();
  try {
    server_->listen();
  } catch (const std::exception& e) {
    handleError(e.what());
    throw;
  }
}

void SystemCoordinator::run() {
  if (currentState_ != State::INIT)
    throw std::logic_error("[SystemCoordinator] run() before initialize()");

  signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
    if (ec)
      return;
    log_->info(kComponent, "signal " + std::to_string(signo) + " received, shutting down");
    requestStop();
  });

  transitionTo(State::SERVING);
  server_->startAccepting();
  io_.run();

  transitionTo(State::DRAINING);
  if (server_->activeSessions() > 0)
    log_->info(kComponent, "waiting for " + std::to_string(server_->activeSessions()) + " request(s) to finish");
  server_->waitForSessions();

  transitionTo(State::STOPPED);
  log_->info(kComponent, "stopped (faults seen: " + std::to_string(errors_->faultCount()) + ")");
  log_->stop();
}

void SystemCoordinator::requestStop() {
  boost::system::error_code ec;
  signals_.cancel(ec);
  if (server_)
    server_->stop();
}

void SystemCoordinator::handleError(const std::string& reason) {
  transitionTo(State::ERROR);
  log_->error(kComponent, reason);
}

void SystemCoordinator::logSettings() {
  const auto& s = settings_;
  log_->info(kComponent, "services: " + registry_->primary() + " + " + registry_->companionLabel() + " via " +
                             s.supervisor.command);
  log_->info(kComponent, "kiosk toggle: " + s.mode.kioskScript + (applicator_->toggleExists() ? "" : " (missing)"));
  log_->info(kComponent, "stack wait " + seconds(s.readiness.stackWaitMax) + ", display wait " +
                             seconds(s.readiness.displayWaitMax) + ", settle " + seconds(s.mode.settleDelay));
  if (!s.readiness.displayReadyCmd.empty())
    log_->info(kComponent, "display probe: " + s.readiness.displayReadyCmd);
}
