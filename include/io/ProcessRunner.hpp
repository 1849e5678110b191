#pragma once
/** @file  ProcessRunner.hpp
 *  @brief Spawns external programs with captured output and a hard deadline.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <string>

#include "io/Command.hpp"

namespace deskctl {
  namespace io {

    /**
 * @class ProcessRunner
 * @brief fork/exec wrapper that drains stdout+stderr through poll() until the
 *        child exits or the deadline passes.
 *
 *  * On deadline the child gets SIGKILL and is reaped; the result is flagged
 *    `timedOut`.
 *  * A program that cannot be executed yields exit code 127, like a shell.
 *  * `run()` is virtual so tests can substitute a scripted environment.
 *  * Safe to call from several threads at once.
 */
    class ProcessRunner {

    public:
      //---ctr / dtr--------------------------------------------
      /// @param display  value exported as DISPLAY when the daemon has none
      explicit ProcessRunner(std::string display = ":0");
      virtual ~ProcessRunner() = default;

      //---public API-------------------------------------------
      virtual CommandResult run(const CommandSpec& spec);

      const std::string& display() const { return display_; }

      //---non-copyable-----------------------------------------
      ProcessRunner(const ProcessRunner&) = delete;
      ProcessRunner& operator=(const ProcessRunner&) = delete;

    private:
      std::string display_;
    };

  } // namespace io
} // namespace deskctl
