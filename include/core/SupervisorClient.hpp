#pragma once
/** @file  SupervisorClient.hpp
 *  @brief Status / start / stop of the desktop services through the supervisor CLI.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// deskctl headers
#include "core/ServiceRegistry.hpp"
#include "core/Settings.hpp"
#include "core/StackStatus.hpp"
#include "io/ProcessRunner.hpp" // SupervisorClient shares the runner and needs full type knowledge

namespace deskctl {
  namespace core {

    class Logger;

    /**
 * @class SupervisorClient
 * @brief Wraps `<command> status|start|stop` calls with bounded timeouts.
 *
 *  * A failed status query yields an empty snapshot (health `Unknown`).
 *  * start/stop are fire-and-forget: failures are logged and show up in the
 *    next snapshot, nothing is retried here.
 */
    class SupervisorClient {
    public:
      SupervisorClient(std::shared_ptr<io::ProcessRunner> runner, const ServiceRegistry& registry,
                       SupervisorSettings settings, Logger& log);

      //---public APIs------------------------------------------------------
      StatusSnapshot statusSnapshot();
      void start(const std::string& name);
      void stop(const std::string& name);

      void startAll(); ///< in startOrder()
      void stopAll();  ///< in stopOrder()

      StackHealth health(const StatusSnapshot& snapshot) const;
      bool stackRunning(const StatusSnapshot& snapshot) const { return isRunning(health(snapshot)); }
      bool stackRunning() { return stackRunning(statusSnapshot()); }

      const ServiceRegistry& registry() const { return registry_; }

    private:
      void control(const char* verb, const std::string& name);

      std::shared_ptr<io::ProcessRunner> runner_;
      const ServiceRegistry& registry_;
      SupervisorSettings settings_;
      Logger& log_;
    };

  } // namespace core
} // namespace deskctl
