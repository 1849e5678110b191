#pragma once
/** @file  FakeProcessRunner.hpp
 *  @brief ProcessRunner derivative that simulates supervisorctl, the kiosk toggle and the X probes.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "io/ProcessRunner.hpp"

namespace deskctl {
  namespace test {

    /**
 * @class FakeProcessRunner
 * @brief Scripted environment: a state map behind `supervisorctl`, a toggle
 *        with a configurable exit code and an X server that answers or not.
 *
 *  * Every invocation is recorded (argv only) for assertions.
 *  * `holdToggle()` parks the next toggle call until `releaseToggle()`, so a
 *    test can issue a concurrent request while a switch is in flight.
 */
    class FakeProcessRunner : public deskctl::io::ProcessRunner {
    public:
      using Argv = std::vector<std::string>;

      std::string supervisorCommand{ "supervisorctl" };
      std::string togglePath;

      //---scripted behaviour (set before use)---------------------------
      bool supervisorAvailable = true; ///< false → status/start/stop all fail
      bool startsWork = true;          ///< false → start leaves the service STOPPED
      bool displayReady = true;
      int toggleExit = 0;
      std::string toggleOut = "kiosk ok";
      std::string toggleErr;

      FakeProcessRunner() : ProcessRunner(":0") {}

      void setState(const std::string& service, const std::string& state) {
        std::lock_guard<std::mutex> lock(mtx_);
        states_[service] = state;
      }

      std::string stateOf(const std::string& service) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = states_.find(service);
        return it == states_.end() ? std::string{} : it->second;
      }

      deskctl::io::CommandResult run(const deskctl::io::CommandSpec& spec) override {
        std::unique_lock<std::mutex> lock(mtx_);
        calls_.push_back(spec.argv);
        const Argv& argv = spec.argv;
        if (argv.empty())
          return deskctl::io::CommandResult::failedToSpawn("empty argv");

        if (argv[0] == supervisorCommand)
          return supervisor(argv);

        if (argv[0] == togglePath) {
          ++toggleCalls_;
          toggleModes_.push_back(argv.size() > 1 ? argv[1] : std::string{});
          if (held_) {
            held_ = false;
            entered_.set_value();
            auto gate = gate_;
            lock.unlock();
            gate.wait();
            lock.lock();
          }
          return deskctl::io::CommandResult::exited(toggleExit, toggleOut, toggleErr);
        }

        if (argv[0] == "xset" || argv[0] == "xdpyinfo" || argv[0] == "/bin/sh")
          return deskctl::io::CommandResult::exited(displayReady ? 0 : 1);

        return deskctl::io::CommandResult::exited(deskctl::io::kExitNotExecutable, "", "not found");
      }

      //---concurrency gate---------------------------------------------
      /// @returns a future that becomes ready once the held toggle call has started
      std::future<void> holdToggle() {
        std::lock_guard<std::mutex> lock(mtx_);
        held_ = true;
        entered_ = std::promise<void>();
        release_ = std::promise<void>();
        gate_ = release_.get_future().share();
        return entered_.get_future();
      }

      void releaseToggle() { release_.set_value(); }

      //---inspection----------------------------------------------------
      std::vector<Argv> calls() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_;
      }

      int toggleCalls() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return toggleCalls_;
      }

      std::vector<std::string> toggleModes() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return toggleModes_;
      }

      /// supervisor control calls (`start`/`stop`) in issue order, as "verb name"
      std::vector<std::string> controlCalls() const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> out;
        for (const auto& argv : calls_)
          if (argv.size() == 3 && argv[0] == supervisorCommand)
            out.push_back(argv[1] + " " + argv[2]);
        return out;
      }

      void clearCalls() {
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.clear();
        toggleModes_.clear();
        toggleCalls_ = 0;
      }

    private:
      // caller holds mtx_
      deskctl::io::CommandResult supervisor(const Argv& argv) {
        if (!supervisorAvailable)
          return deskctl::io::CommandResult::exited(2, "", "unix:///var/run/supervisor.sock no such file");

        if (argv.size() == 2 && argv[1] == "status") {
          std::string out;
          for (const auto& [name, state] : states_)
            out += name + "                           " + state + "   pid 42, uptime 0:00:10\n";
          return deskctl::io::CommandResult::exited(0, out);
        }
        if (argv.size() == 3 && argv[1] == "start") {
          states_[argv[2]] = startsWork ? "RUNNING" : "STOPPED";
          return startsWork ? deskctl::io::CommandResult::exited(0, argv[2] + ": started")
                            : deskctl::io::CommandResult::exited(7, "", argv[2] + ": ERROR (spawn error)");
        }
        if (argv.size() == 3 && argv[1] == "stop") {
          states_[argv[2]] = "STOPPED";
          return deskctl::io::CommandResult::exited(0, argv[2] + ": stopped");
        }
        return deskctl::io::CommandResult::exited(2, "", "unknown command");
      }

      mutable std::mutex mtx_;
      std::map<std::string, std::string> states_;
      std::vector<Argv> calls_;
      std::vector<std::string> toggleModes_;
      int toggleCalls_{ 0 };

      bool held_{ false };
      std::promise<void> entered_;
      std::promise<void> release_;
      std::shared_future<void> gate_;
    };

  } // namespace test
} // namespace deskctl
