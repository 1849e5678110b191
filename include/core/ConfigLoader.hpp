#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON file + environment overrides).
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Settings.hpp"

namespace deskctl::core {

  /// Environment lookup; tests pass a map-backed lambda instead of getenv.
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

  /// Reads the real process environment.
  EnvLookup processEnvironment();

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and folds it, then the
 *        environment, over the built-in defaults.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Every malformed or out-of-range value throws `std::runtime_error`
 *    naming the offending key.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path; empty means defaults only.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// Defaults < file < environment.
    Settings resolve(const EnvLookup& env) const;

    /// Overlay the recognised keys of \p doc onto \p settings.
    static void applyJson(Settings& settings, const nlohmann::json& doc);

    /// Overlay the deployment environment variables onto \p settings.
    static void applyEnvironment(Settings& settings, const EnvLookup& env);

    /// Cross-field checks (port range, positive poll intervals, ...).
    static void validate(const Settings& settings);

  private:
    std::string path_;
  };

} // namespace deskctl::core
