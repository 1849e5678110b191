#pragma once
/** @file  ModeApplicator.hpp
 *  @brief Runs the external kiosk toggle with `on` / `off`.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>

#include "core/Mode.hpp"
#include "core/Settings.hpp"

namespace deskctl::io {
  class ProcessRunner;
}

namespace deskctl::core {

  class Logger;

  /**
 * @class ModeApplicator
 * @brief Success iff the toggle exits 0 within its timeout.
 *
 *  * A missing toggle fails with `missing_script:<path>` and spawns nothing.
 *  * Message: trimmed stdout, else trimmed stderr, else the failure reason,
 *    else `ok`.
 */
  class ModeApplicator {
  public:
    ModeApplicator(std::shared_ptr<io::ProcessRunner> runner, ModeSettings settings, Logger& log);

    /// @pre mode is On or Off
    ApplyResult apply(Mode mode);

    bool toggleExists() const;
    const std::string& scriptPath() const { return settings_.kioskScript; }

  private:
    std::shared_ptr<io::ProcessRunner> runner_;
    ModeSettings settings_;
    Logger& log_;
  };

} // namespace deskctl::core
