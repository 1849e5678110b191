/* @file ReadinessProber.cpp
 * @brief stack/display readiness polling with hard deadlines
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <thread>

// deskctl headers
#include "core/Logger.hpp"
#include "core/ReadinessProber.hpp"
#include "core/SupervisorClient.hpp"
#include "io/ProcessRunner.hpp"

using namespace deskctl::core;
using Clock = std::chrono::steady_clock;

namespace {
  constexpr const char* kComponent = "readiness";
}

ReadinessProber::ReadinessProber(SupervisorClient& supervisor, std::shared_ptr<io::ProcessRunner> runner,
                                 ReadinessSettings settings, Logger& log)
    : supervisor_(supervisor), runner_(std::move(runner)), settings_(std::move(settings)), log_(log) {
  if (!runner_)
    throw std::invalid_argument("[ReadinessProber] process runner is nullptr");
}

std::vector<std::vector<std::string>> ReadinessProber::fallbackProbes() {
  return { { "xset", "q" }, { "xdpyinfo" } };
}

bool ReadinessProber::waitStackReady(std::chrono::milliseconds maxWait) {
  const auto deadline = Clock::now() + maxWait;
  while (Clock::now() < deadline) {
    if (supervisor_.stackRunning(supervisor_.statusSnapshot()))
      return true;
    std::this_thread::sleep_for(settings_.stackPoll);
  }
  log_.warn(kComponent, "stack not running after " + std::to_string(maxWait.count()) + "ms");
  return false;
}

bool ReadinessProber::waitDisplayReady(std::chrono::milliseconds maxWait) {
  const auto deadline = Clock::now() + maxWait;
  while (Clock::now() < deadline) {
    if (probeDisplayOnce())
      return true;
    std::this_thread::sleep_for(settings_.displayPoll);
  }
  log_.warn(kComponent, "display not answering after " + std::to_string(maxWait.count()) + "ms");
  return false;
}

bool ReadinessProber::probeDisplayOnce() {
  if (!settings_.displayReadyCmd.empty()) {
    io::CommandResult res =
        runner_->run({ { "/bin/sh", "-lc", settings_.displayReadyCmd }, settings_.probeTimeout });
    return res.ok();
  }

  for (const auto& argv : fallbackProbes()) {
    io::CommandResult res = runner_->run({ argv, settings_.probeTimeout });
    if (res.ok())
      return true;
    if (res.exitCode == io::kExitNotExecutable)
      log_.debug(kComponent, argv.front() + " not available");
  }
  return false;
}
