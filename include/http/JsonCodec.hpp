#pragma once
/** @file  JsonCodec.hpp
 *  @brief Reply bodies for status and reconciliation results.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <string>

#include <nlohmann/json.hpp>

#include "core/ModeReconciler.hpp"

namespace deskctl::http {

  /// services, running, last_switch_ts, kiosk_script, wm_service,
  /// desktop_service, current_mode, last_apply_ts
  nlohmann::json toJson(const core::StatusReport& report);

  /// Status fields plus ok/busy/changed/... for /kiosk and /show.
  nlohmann::json toJson(const core::EnsureOutcome& outcome);

  /// {"ok": false, "error": <code>, ...extra}
  nlohmann::json errorBody(const std::string& code, nlohmann::json extra = nlohmann::json::object());

  /// Pretty-printed wire text. Invalid UTF-8 (toggle output, supervisor
  /// states, request paths) becomes U+FFFD instead of throwing.
  std::string serialize(const nlohmann::json& body);

} // namespace deskctl::http
