/* @file ControlApi.cpp
 * @brief route table and request boundary of the control API
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

#include <stdexcept>

#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ModeReconciler.hpp"
#include "http/ControlApi.hpp"
#include "http/JsonCodec.hpp"

using namespace deskctl::http;

namespace {
  constexpr const char* kComponent = "api";
}

ControlApi::ControlApi(core::ModeReconciler& reconciler, std::shared_ptr<core::ErrorMonitor> errors,
                       core::Logger& log)
    : reconciler_(reconciler), errors_(std::move(errors)), log_(log) {
  if (!errors_)
    throw std::invalid_argument("[ControlApi] error monitor is nullptr");
  registerRoutes();
}

void ControlApi::registerRoutes() {
  bool ok = true;
  ok = router_.addAliases({ "/", "/debug", "/mode" }, [this](const Request& r) { return status(r); }) && ok;
  ok = router_.addAliases({ "/kiosk", "/hide" }, [this](const Request& r) { return ensure(r, true); }) && ok;
  ok = router_.addAliases({ "/show", "/desktop" }, [this](const Request& r) { return ensure(r, false); }) && ok;
  ok = router_.addAliases({ "/restart", "/reset" }, [this](const Request& r) { return restart(r); }) && ok;
  if (!ok)
    throw std::logic_error("[ControlApi] duplicate route registration");
}

Reply ControlApi::handle(const std::string& method, const std::string& target) {
  try {
    Request req = Request::fromTarget(method, target);
    if (req.method != "GET")
      return { 501, errorBody("unsupported_method", { { "method", req.method } }) };

    log_.debug(kComponent, "GET " + target);
    if (auto reply = router_.dispatch(req))
      return *reply;
    return { 404, errorBody("not_found", { { "path", req.path } }) };
  } catch (const std::exception& e) {
    errors_->notifyFailure(std::string("request ") + target + ": " + e.what());
    return { 500, errorBody("exception", { { "message", e.what() } }) };
  }
}

Reply ControlApi::status(const Request&) {
  nlohmann::json body = toJson(reconciler_.statusReport());
  body["ok"] = true;
  return { 200, body };
}

Reply ControlApi::ensure(const Request& req, bool wantKiosk) {
  core::EnsureOutcome outcome = reconciler_.ensureMode(req.force(), wantKiosk);
  return { outcome.httpStatus, toJson(outcome) };
}

Reply ControlApi::restart(const Request&) {
  bool up = reconciler_.restartStack();
  if (!up)
    log_.warn(kComponent, "restart finished but stack is not running yet");
  nlohmann::json body = toJson(reconciler_.statusReport());
  body["ok"] = true;
  body["message"] = "restarted";
  return { 200, body };
}
