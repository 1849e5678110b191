/* @file ServiceRegistry.cpp
 * @brief start/stop ordering of the managed desktop services
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

#include <algorithm>
#include <array>
#include <cctype>

#include "core/ServiceRegistry.hpp"

using namespace deskctl::core;

namespace {
  std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
      return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }
} // namespace

bool ServiceRegistry::isDisabledSentinel(const std::string& name) {
  static constexpr std::array<const char*, 4> kSentinels{ "none", "null", "0", "false" };
  std::string lower = trimmed(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower.empty())
    return true;
  return std::find(kSentinels.begin(), kSentinels.end(), lower) != kSentinels.end();
}

ServiceRegistry::ServiceRegistry(const std::string& wmService, const std::string& companionService)
    : wm_(trimmed(wmService)) {
  if (wm_.empty())
    wm_ = kDefaultWm;

  std::string companion = trimmed(companionService);
  if (!isDisabledSentinel(companion) && companion != wm_)
    companion_ = companion;

  start_.push_back(wm_);
  if (companion_)
    start_.push_back(*companion_);
  stop_.assign(start_.rbegin(), start_.rend());
}
