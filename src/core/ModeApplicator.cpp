/* @file ModeApplicator.cpp
 * @brief kiosk toggle invocation and result interpretation
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <stdexcept>
#include <system_error>

// deskctl headers
#include "core/Logger.hpp"
#include "core/ModeApplicator.hpp"
#include "io/ProcessRunner.hpp"

using namespace deskctl::core;

namespace {
  constexpr const char* kComponent = "mode";

  std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
      return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }
} // namespace

ModeApplicator::ModeApplicator(std::shared_ptr<io::ProcessRunner> runner, ModeSettings settings, Logger& log)
    : runner_(std::move(runner)), settings_(std::move(settings)), log_(log) {
  if (!runner_)
    throw std::invalid_argument("[ModeApplicator] process runner is nullptr");
}

bool ModeApplicator::toggleExists() const {
  std::error_code ec;
  return std::filesystem::exists(settings_.kioskScript, ec);
}

ApplyResult ModeApplicator::apply(Mode mode) {
  if (mode == Mode::Unknown)
    throw std::invalid_argument("[ModeApplicator] cannot apply mode 'unknown'");

  if (!toggleExists()) {
    log_.error(kComponent, "kiosk toggle missing at " + settings_.kioskScript);
    return { false, "missing_script:" + settings_.kioskScript };
  }

  io::CommandResult res = runner_->run({ { settings_.kioskScript, toString(mode) }, settings_.applyTimeout });

  ApplyResult result;
  result.ok = res.ok();
  std::string out = trim(res.out);
  std::string err = trim(res.err);
  if (!out.empty())
    result.message = out;
  else if (!err.empty())
    result.message = err;
  else if (!result.ok && !res.reason.empty())
    result.message = res.reason;
  else
    result.message = "ok";

  if (result.ok)
    log_.info(kComponent, std::string("applied mode=") + toString(mode) + ": " + result.message);
  else
    log_.warn(kComponent, std::string("apply mode=") + toString(mode) + " failed (" + res.reason + "): " +
                              result.message);
  return result;
}
