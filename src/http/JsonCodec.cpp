/* @file JsonCodec.cpp
 * @brief StatusReport / EnsureOutcome → JSON reply bodies
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

#include "http/JsonCodec.hpp"

using nlohmann::json;

namespace deskctl::http {

  json toJson(const core::StatusReport& report) {
    json services = json::object();
    for (const auto& [name, state] : report.services)
      services[name] = state;

    return json{
      { "services", services },
      { "running", report.running },
      { "last_switch_ts", report.lastSwitchTs },
      { "kiosk_script", report.kioskScript },
      { "wm_service", report.wmService },
      { "desktop_service", report.desktopService },
      { "current_mode", core::toString(report.currentMode) },
      { "last_apply_ts", report.lastApplyTs },
    };
  }

  json toJson(const core::EnsureOutcome& outcome) {
    if (outcome.fault)
      return errorBody("exception", { { "message", outcome.error } });

    json body = toJson(outcome.status);
    body["ok"] = outcome.ok;
    body["busy"] = outcome.busy;
    body["changed"] = outcome.changed;
    body["message"] = outcome.message;
    if (outcome.busy)
      return body;

    body["requested_mode"] = core::toString(outcome.requestedMode);
    body["applied"] = outcome.applied;
    body["mode_ok"] = outcome.modeOk;
    body["mode_msg"] = outcome.modeMessage;
    return body;
  }

  json errorBody(const std::string& code, json extra) {
    json body{ { "ok", false }, { "error", code } };
    body.update(extra);
    return body;
  }

  std::string serialize(const json& body) { return body.dump(2, ' ', false, json::error_handler_t::replace); }

} // namespace deskctl::http
