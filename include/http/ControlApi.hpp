#pragma once
/** @file  ControlApi.hpp
 *  @brief The GET endpoints (/mode, /kiosk, /show, /restart and aliases).
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <memory>
#include <string>

#include "http/Router.hpp"

namespace deskctl::core {
  class ErrorMonitor;
  class Logger;
  class ModeReconciler;
} // namespace deskctl::core

namespace deskctl::http {

  /**
 * @class ControlApi
 * @brief Transport-free request handling: method + target in, status + JSON out.
 *
 *  * Unknown path → 404, non-GET → 501.
 *  * Any std::exception from a handler becomes a 500 body and is reported to
 *    the error monitor; nothing escapes `handle()`.
 */
  class ControlApi {
  public:
    ControlApi(core::ModeReconciler& reconciler, std::shared_ptr<core::ErrorMonitor> errors, core::Logger& log);

    Reply handle(const std::string& method, const std::string& target);

  private:
    void registerRoutes();

    Reply status(const Request& req);
    Reply ensure(const Request& req, bool wantKiosk);
    Reply restart(const Request& req);

    core::ModeReconciler& reconciler_;
    std::shared_ptr<core::ErrorMonitor> errors_;
    core::Logger& log_;
    Router router_;
  };

} // namespace deskctl::http
