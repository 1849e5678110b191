#pragma once
/** @file  Settings.hpp
 *  @brief Run-time configuration values with the built-in defaults.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace deskctl {
  namespace core {

    using std::chrono::milliseconds;

    struct ServerSettings {
      std::string host{ "0.0.0.0" };
      std::uint16_t port{ 9001 };
    };

    struct SupervisorSettings {
      std::string command{ "supervisorctl" };
      std::string wmService{ "xfce" };
      std::string desktopService{ "none" }; ///< companion; sentinel values disable it
      milliseconds statusTimeout{ 5000 };
      milliseconds controlTimeout{ 10000 };
    };

    struct ReadinessSettings {
      milliseconds stackWaitMax{ 8000 };
      milliseconds stackPoll{ 200 };
      milliseconds displayWaitMax{ 6000 };
      milliseconds displayPoll{ 200 };
      std::string displayReadyCmd{}; ///< empty → built-in xset/xdpyinfo probes
      milliseconds probeTimeout{ 3000 };
    };

    struct ModeSettings {
      std::string kioskScript{ "/data/conf/scripts/kiosk_mode.sh" };
      milliseconds applyTimeout{ 20000 };
      milliseconds settleDelay{ 800 };
    };

    struct LoggingSettings {
      std::string file{};
      bool verbose{ false };
      std::size_t queueCapacity{ 1024 };
    };

    struct Settings {
      ServerSettings server;
      SupervisorSettings supervisor;
      ReadinessSettings readiness;
      ModeSettings mode;
      LoggingSettings logging;
      std::string display{ ":0" }; ///< DISPLAY for child processes that lack one
    };

  } // namespace core
} // namespace deskctl
