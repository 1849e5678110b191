#pragma once
/** @file  StackStatus.hpp
 *  @brief Supervisor status snapshot and the tri-state stack health derived from it.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace deskctl {
  namespace core {

    /// Supervisor process states; anything unrecognised maps to `Other`.
    enum class ServiceState : std::uint8_t {
      Running,
      Stopped,
      Starting,
      Backoff,
      Stopping,
      Exited,
      Fatal,
      Unknown,
      Other
    };

    ServiceState parseServiceState(const std::string& raw);

    /**
 * @enum StackHealth
 * @brief Aggregate of the required services.
 *
 *  `Unknown` means the status channel gave us nothing at all. It reduces to
 *  "running" in `isRunning()` so a flaky supervisor does not trigger restarts.
 */
    enum class StackHealth { Running, NotRunning, Unknown };

    inline const char* toString(StackHealth h) {
      switch (h) {
      case StackHealth::Running:
        return "running";
      case StackHealth::NotRunning:
        return "not_running";
      case StackHealth::Unknown:
        return "unknown";
      default:
        return "unknown";
      }
    }

    /// Fail-open reduction: only a definite NotRunning counts as down.
    inline bool isRunning(StackHealth h) { return h != StackHealth::NotRunning; }

    /**
 * @struct StatusSnapshot
 * @brief name → raw state as printed by the supervisor; empty when the
 *        status query failed.
 */
    struct StatusSnapshot {
      std::map<std::string, std::string> states;

      bool empty() const { return states.empty(); }

      /// Raw state for \p name, `UNKNOWN` when the supervisor did not list it.
      std::string stateOf(const std::string& name) const {
        auto it = states.find(name);
        return it == states.end() ? "UNKNOWN" : it->second;
      }

      /// Parse `supervisorctl status` output: first field name, second field state.
      static StatusSnapshot parse(const std::string& output);
    };

    StackHealth evaluateHealth(const StatusSnapshot& snapshot, const std::vector<std::string>& required);

  } // namespace core
} // namespace deskctl
