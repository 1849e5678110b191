/* @file ConfigLoader.cpp
 * @brief JSON + environment configuration, validated into core::Settings
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// deskctl headers
#include "core/ConfigLoader.hpp"

using namespace deskctl::core;
using nlohmann::json;

namespace {

  std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
      return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }

  milliseconds secondsToMs(double seconds, const std::string& key) {
    if (!std::isfinite(seconds) || seconds < 0.0)
      throw std::runtime_error("[ConfigLoader] " + key + " must be a non-negative number of seconds");
    return milliseconds{ static_cast<long long>(std::llround(seconds * 1000.0)) };
  }

  double parseNumber(const std::string& raw, const std::string& key) {
    std::string text = trim(raw);
    std::size_t used = 0;
    double value = 0.0;
    try {
      value = std::stod(text, &used);
    } catch (const std::exception&) {
      throw std::runtime_error("[ConfigLoader] " + key + " is not a number: '" + raw + "'");
    }
    if (used != text.size())
      throw std::runtime_error("[ConfigLoader] " + key + " is not a number: '" + raw + "'");
    return value;
  }

  std::uint16_t parsePort(long long value, const std::string& key) {
    if (value < 1 || value > 65535)
      throw std::runtime_error("[ConfigLoader] " + key + " out of range 1..65535");
    return static_cast<std::uint16_t>(value);
  }

  bool parseFlag(const std::string& raw) {
    std::string v = trim(raw);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
  }

  std::string qualified(const std::string& where, const char* key) {
    return where.empty() ? std::string(key) : where + "." + key;
  }

  // --- typed JSON accessors; a present key of the wrong type is an error ---

  void readString(const json& obj, const char* key, const std::string& where, std::string& out) {
    if (!obj.contains(key))
      return;
    const auto& v = obj.at(key);
    if (!v.is_string())
      throw std::runtime_error("[ConfigLoader] " + qualified(where, key) + " must be a string");
    out = v.get<std::string>();
  }

  void readSeconds(const json& obj, const char* key, const std::string& where, milliseconds& out) {
    if (!obj.contains(key))
      return;
    const auto& v = obj.at(key);
    if (!v.is_number())
      throw std::runtime_error("[ConfigLoader] " + qualified(where, key) + " must be a number");
    out = secondsToMs(v.get<double>(), qualified(where, key));
  }

  void readBool(const json& obj, const char* key, const std::string& where, bool& out) {
    if (!obj.contains(key))
      return;
    const auto& v = obj.at(key);
    if (!v.is_boolean())
      throw std::runtime_error("[ConfigLoader] " + qualified(where, key) + " must be true/false");
    out = v.get<bool>();
  }

  const json* section(const json& doc, const char* name) {
    if (!doc.contains(name))
      return nullptr;
    const auto& s = doc.at(name);
    if (!s.is_object())
      throw std::runtime_error(std::string("[ConfigLoader] section '") + name + "' must be an object");
    return &s;
  }

} // namespace

EnvLookup deskctl::core::processEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* v = std::getenv(name.c_str());
    if (!v)
      return std::nullopt;
    return std::string(v);
  };
}

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in.is_open())
    throw std::runtime_error("[ConfigLoader] cannot open config file " + path_);
  try {
    json doc = json::parse(in);
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] top level of " + path_ + " must be an object");
    return doc;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] malformed JSON in " + path_ + ": " + e.what());
  }
}

Settings ConfigLoader::resolve(const EnvLookup& env) const {
  Settings settings;
  if (!path_.empty())
    applyJson(settings, load());
  applyEnvironment(settings, env);
  validate(settings);
  return settings;
}

void ConfigLoader::applyJson(Settings& s, const json& doc) {
  if (const json* srv = section(doc, "server")) {
    readString(*srv, "host", "server", s.server.host);
    if (srv->contains("port")) {
      const auto& p = srv->at("port");
      if (!p.is_number_integer())
        throw std::runtime_error("[ConfigLoader] server.port must be an integer");
      s.server.port = parsePort(p.get<long long>(), "server.port");
    }
  }

  if (const json* sup = section(doc, "supervisor")) {
    readString(*sup, "command", "supervisor", s.supervisor.command);
    readString(*sup, "wm_service", "supervisor", s.supervisor.wmService);
    readString(*sup, "desktop_service", "supervisor", s.supervisor.desktopService);
    readSeconds(*sup, "status_timeout_sec", "supervisor", s.supervisor.statusTimeout);
    readSeconds(*sup, "control_timeout_sec", "supervisor", s.supervisor.controlTimeout);
  }

  if (const json* rd = section(doc, "readiness")) {
    readSeconds(*rd, "stack_wait_max_sec", "readiness", s.readiness.stackWaitMax);
    readSeconds(*rd, "stack_poll_sec", "readiness", s.readiness.stackPoll);
    readSeconds(*rd, "display_wait_max_sec", "readiness", s.readiness.displayWaitMax);
    readSeconds(*rd, "display_poll_sec", "readiness", s.readiness.displayPoll);
    readString(*rd, "display_ready_cmd", "readiness", s.readiness.displayReadyCmd);
    readSeconds(*rd, "probe_timeout_sec", "readiness", s.readiness.probeTimeout);
  }

  if (const json* md = section(doc, "mode")) {
    readString(*md, "kiosk_script", "mode", s.mode.kioskScript);
    readSeconds(*md, "apply_timeout_sec", "mode", s.mode.applyTimeout);
    readSeconds(*md, "settle_delay_sec", "mode", s.mode.settleDelay);
  }

  if (const json* lg = section(doc, "logging")) {
    readString(*lg, "file", "logging", s.logging.file);
    readBool(*lg, "verbose", "logging", s.logging.verbose);
    if (lg->contains("queue_capacity")) {
      const auto& q = lg->at("queue_capacity");
      if (!q.is_number_unsigned() || q.get<std::size_t>() == 0)
        throw std::runtime_error("[ConfigLoader] logging.queue_capacity must be a positive integer");
      s.logging.queueCapacity = q.get<std::size_t>();
    }
  }

  readString(doc, "display", "", s.display);
}

void ConfigLoader::applyEnvironment(Settings& s, const EnvLookup& env) {
  if (auto v = env("TOOLBAR_API_HOST"))
    s.server.host = *v;
  if (auto v = env("TOOLBAR_API_PORT")) {
    double port = parseNumber(*v, "TOOLBAR_API_PORT");
    if (port != std::floor(port))
      throw std::runtime_error("[ConfigLoader] TOOLBAR_API_PORT must be an integer");
    s.server.port = parsePort(static_cast<long long>(port), "TOOLBAR_API_PORT");
  }
  if (auto v = env("SUPERVISORCTL"))
    s.supervisor.command = *v;
  if (auto v = env("WM_SERVICE"))
    s.supervisor.wmService = *v;
  if (auto v = env("DESKTOP_SERVICE"))
    s.supervisor.desktopService = *v;
  if (auto v = env("KIOSK_SCRIPT"))
    s.mode.kioskScript = *v;

  if (auto v = env("DESKTOP_WAIT_MAX_SEC"))
    s.readiness.stackWaitMax = secondsToMs(parseNumber(*v, "DESKTOP_WAIT_MAX_SEC"), "DESKTOP_WAIT_MAX_SEC");
  if (auto v = env("DESKTOP_WAIT_POLL_SEC"))
    s.readiness.stackPoll = secondsToMs(parseNumber(*v, "DESKTOP_WAIT_POLL_SEC"), "DESKTOP_WAIT_POLL_SEC");
  if (auto v = env("MODE_APPLY_DELAY_SEC"))
    s.mode.settleDelay = secondsToMs(parseNumber(*v, "MODE_APPLY_DELAY_SEC"), "MODE_APPLY_DELAY_SEC");
  if (auto v = env("X_READY_MAX_SEC"))
    s.readiness.displayWaitMax = secondsToMs(parseNumber(*v, "X_READY_MAX_SEC"), "X_READY_MAX_SEC");
  if (auto v = env("X_READY_POLL_SEC"))
    s.readiness.displayPoll = secondsToMs(parseNumber(*v, "X_READY_POLL_SEC"), "X_READY_POLL_SEC");
  if (auto v = env("X_READY_CMD"))
    s.readiness.displayReadyCmd = trim(*v);

  if (auto v = env("DESKCTL_LOG_FILE"))
    s.logging.file = *v;
  if (auto v = env("DESKCTL_VERBOSE"))
    s.logging.verbose = parseFlag(*v);
}

void ConfigLoader::validate(const Settings& s) {
  if (s.server.host.empty())
    throw std::runtime_error("[ConfigLoader] server host must not be empty");
  if (s.server.port == 0)
    throw std::runtime_error("[ConfigLoader] server port must be 1..65535");
  if (trim(s.supervisor.command).empty())
    throw std::runtime_error("[ConfigLoader] supervisor command must not be empty");
  if (s.readiness.stackPoll.count() <= 0 || s.readiness.displayPoll.count() <= 0)
    throw std::runtime_error("[ConfigLoader] poll intervals must be greater than zero");
  if (s.supervisor.statusTimeout.count() <= 0 || s.supervisor.controlTimeout.count() <= 0 ||
      s.readiness.probeTimeout.count() <= 0 || s.mode.applyTimeout.count() <= 0)
    throw std::runtime_error("[ConfigLoader] command timeouts must be greater than zero");
  if (s.mode.kioskScript.empty())
    throw std::runtime_error("[ConfigLoader] kiosk script path must not be empty");
}
