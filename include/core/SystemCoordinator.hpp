#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for deskctl::core::SystemCoordinator.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "core/Settings.hpp"

namespace deskctl {
  namespace io {
    class ProcessRunner;
  }
  namespace http {
    class ControlApi;
    class ControlServer;
  } // namespace http

  namespace core {

    class ErrorMonitor;
    class Logger;
    class ModeApplicator;
    class ModeReconciler;
    class ReadinessProber;
    class ServiceRegistry;
    class SupervisorClient;

    /**
 * @class SystemCoordinator
 * @brief Builds the object graph from Settings and runs the daemon lifecycle.
 *
 *  BOOT → INIT → SERVING → DRAINING → STOPPED, or → ERROR when
 *  initialization fails. SIGINT/SIGTERM move SERVING to DRAINING.
 */
    class SystemCoordinator {

    public:
      explicit SystemCoordinator(Settings settings);
      ~SystemCoordinator();

      // ---- public API ----
      void initialize(); ///< start logger, wire components, bind the listener
      void run();        ///< serve until a stop signal, then drain workers
      void requestStop();
      void handleError(const std::string& reason);

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      enum class State { BOOT, INIT, SERVING, DRAINING, STOPPED, ERROR };

      static const char* toString(State s);
      void transitionTo(State next);
      void logSettings();

      Settings settings_;
      State currentState_{ State::BOOT };

      std::unique_ptr<Logger> log_;
      std::shared_ptr<ErrorMonitor> errors_;
      std::shared_ptr<io::ProcessRunner> runner_;
      std::unique_ptr<ServiceRegistry> registry_;
      std::unique_ptr<SupervisorClient> supervisor_;
      std::unique_ptr<ReadinessProber> prober_;
      std::unique_ptr<ModeApplicator> applicator_;
      std::unique_ptr<ModeReconciler> reconciler_;
      std::unique_ptr<http::ControlApi> api_;

      boost::asio::io_context io_;
      boost::asio::signal_set signals_;
      std::unique_ptr<http::ControlServer> server_;
    };

  } // namespace core
} // namespace deskctl
