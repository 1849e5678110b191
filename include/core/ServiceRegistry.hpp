#pragma once
/** @file  ServiceRegistry.hpp
 *  @brief Which supervisor programs make up the desktop stack, and in what order.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

namespace deskctl::core {

  /**
 * @class ServiceRegistry
 * @brief Window manager plus an optional companion service.
 *
 *  * The companion is dropped when empty, equal to the window manager, or one
 *    of `none` / `null` / `0` / `false` (any case).
 *  * Orders are computed once; `stopOrder()` is the exact reverse of
 *    `startOrder()`.
 */
  class ServiceRegistry {
  public:
    static constexpr const char* kDefaultWm = "xfce";

    ServiceRegistry(const std::string& wmService, const std::string& companionService);

    const std::vector<std::string>& startOrder() const { return start_; }
    const std::vector<std::string>& stopOrder() const { return stop_; }

    const std::string& primary() const { return wm_; }
    const std::optional<std::string>& companion() const { return companion_; }
    bool companionEnabled() const { return companion_.has_value(); }

    /// Companion name for status output, `none` when disabled.
    std::string companionLabel() const { return companion_ ? *companion_ : "none"; }

    static bool isDisabledSentinel(const std::string& name);

  private:
    std::string wm_;
    std::optional<std::string> companion_;
    std::vector<std::string> start_;
    std::vector<std::string> stop_;
  };

} // namespace deskctl::core
