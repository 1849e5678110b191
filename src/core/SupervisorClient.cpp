/* @file SupervisorClient.cpp
 * @brief talks to the process supervisor through its control CLI
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// deskctl headers
#include "core/Logger.hpp"
#include "core/SupervisorClient.hpp"

using namespace deskctl::core;

namespace {
  constexpr const char* kComponent = "supervisor";
}

SupervisorClient::SupervisorClient(std::shared_ptr<io::ProcessRunner> runner, const ServiceRegistry& registry,
                                   SupervisorSettings settings, Logger& log)
    : runner_(std::move(runner)), registry_(registry), settings_(std::move(settings)), log_(log) {
  if (!runner_)
    throw std::invalid_argument("[SupervisorClient] process runner is nullptr");
}

StatusSnapshot SupervisorClient::statusSnapshot() {
  io::CommandResult res = runner_->run({ { settings_.command, "status" }, settings_.statusTimeout });
  if (!res.ok()) {
    // includes the case where supervisorctl exits non-zero because a program is down
    log_.debug(kComponent, "status query failed (" + res.reason + ")");
    return {};
  }
  return StatusSnapshot::parse(res.out);
}

void SupervisorClient::start(const std::string& name) { control("start", name); }

void SupervisorClient::stop(const std::string& name) { control("stop", name); }

void SupervisorClient::startAll() {
  for (const auto& name : registry_.startOrder())
    start(name);
}

void SupervisorClient::stopAll() {
  for (const auto& name : registry_.stopOrder())
    stop(name);
}

StackHealth SupervisorClient::health(const StatusSnapshot& snapshot) const {
  return evaluateHealth(snapshot, registry_.startOrder());
}

void SupervisorClient::control(const char* verb, const std::string& name) {
  io::CommandSpec spec{ { settings_.command, verb, name }, settings_.controlTimeout };
  io::CommandResult res = runner_->run(spec);
  if (!res.ok()) {
    log_.warn(kComponent, spec.toString() + " failed: " + res.reason);
    return;
  }
  log_.debug(kComponent, spec.toString() + " ok");
}
