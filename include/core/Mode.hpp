#pragma once
/** @file  Mode.hpp
 *  @brief Display mode values shared by the applicator and the reconciler.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace deskctl {
  namespace core {

    enum class Mode : std::uint8_t { Unknown, On, Off };

    inline const char* toString(Mode m) {
      switch (m) {
      case Mode::On:
        return "on";
      case Mode::Off:
        return "off";
      default:
        return "unknown";
      }
    }

    inline Mode desiredMode(bool wantKiosk) { return wantKiosk ? Mode::On : Mode::Off; }

    /// Outcome of one toggle invocation; `message` is diagnostic only.
    struct ApplyResult {
      bool ok{ false };
      std::string message;
    };

  } // namespace core
} // namespace deskctl
