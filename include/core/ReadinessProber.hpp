#pragma once
/** @file  ReadinessProber.hpp
 *  @brief Bounded polling for "stack is up" and "display answers".
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/Settings.hpp"
#include "io/Command.hpp"

namespace deskctl::io {
  class ProcessRunner;
}

namespace deskctl::core {

  class Logger;
  class SupervisorClient;

  /**
 * @class ReadinessProber
 * @brief Two independent wait loops; both return false on timeout and never throw.
 *
 *  * Display probing runs the configured shell command, or else tries each
 *    fallback probe (`xset q`, `xdpyinfo`) in order on every tick. A probe
 *    that is not installed simply fails that tick.
 */
  class ReadinessProber {
  public:
    ReadinessProber(SupervisorClient& supervisor, std::shared_ptr<io::ProcessRunner> runner,
                    ReadinessSettings settings, Logger& log);

    bool waitStackReady(std::chrono::milliseconds maxWait);
    bool waitDisplayReady(std::chrono::milliseconds maxWait);

    /// Same, with the configured maxima.
    bool waitStackReady() { return waitStackReady(settings_.stackWaitMax); }
    bool waitDisplayReady() { return waitDisplayReady(settings_.displayWaitMax); }

    static std::vector<std::vector<std::string>> fallbackProbes();

  private:
    bool probeDisplayOnce();

    SupervisorClient& supervisor_;
    std::shared_ptr<io::ProcessRunner> runner_;
    ReadinessSettings settings_;
    Logger& log_;
  };

} // namespace deskctl::core
