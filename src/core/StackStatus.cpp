/* @file StackStatus.cpp
 * @brief parsing of supervisor status output and the fail-open health rule
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

#include <sstream>

#include "core/StackStatus.hpp"

namespace deskctl {
  namespace core {

    ServiceState parseServiceState(const std::string& raw) {
      if (raw == "RUNNING")
        return ServiceState::Running;
      if (raw == "STOPPED")
        return ServiceState::Stopped;
      if (raw == "STARTING")
        return ServiceState::Starting;
      if (raw == "BACKOFF")
        return ServiceState::Backoff;
      if (raw == "STOPPING")
        return ServiceState::Stopping;
      if (raw == "EXITED")
        return ServiceState::Exited;
      if (raw == "FATAL")
        return ServiceState::Fatal;
      if (raw == "UNKNOWN")
        return ServiceState::Unknown;
      return ServiceState::Other;
    }

    StatusSnapshot StatusSnapshot::parse(const std::string& output) {
      StatusSnapshot snap;
      std::istringstream lines(output);
      std::string line;
      while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string name, state;
        if (fields >> name >> state)
          snap.states[name] = state;
      }
      return snap;
    }

    StackHealth evaluateHealth(const StatusSnapshot& snapshot, const std::vector<std::string>& required) {
      if (snapshot.empty())
        return StackHealth::Unknown;
      for (const auto& name : required) {
        auto it = snapshot.states.find(name);
        if (it == snapshot.states.end() || parseServiceState(it->second) != ServiceState::Running)
          return StackHealth::NotRunning;
      }
      return StackHealth::Running;
    }

  } // namespace core
} // namespace deskctl
