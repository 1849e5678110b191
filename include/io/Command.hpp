#pragma once
/** @file  Command.hpp
 *  @brief External command description and its captured outcome.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>
#include <vector>

namespace deskctl {
  namespace io {

    /// Exit code reported when the program could not be executed at all.
    inline constexpr int kExitNotExecutable = 127;

    struct CommandSpec {
      std::vector<std::string> argv;
      std::chrono::milliseconds timeout{ 10000 };

      /// Space-joined argv, for log lines only.
      std::string toString() const {
        std::string out;
        for (const auto& arg : argv) {
          if (!out.empty())
            out += ' ';
          out += arg;
        }
        return out;
      }
    };

    /**
 * @struct CommandResult
 * @brief Outcome of one external invocation; never thrown, always returned.
 *
 *  * `exitCode` is the child's exit status, 128+signal when it was killed,
 *    or -1 when nothing was spawned.
 *  * `reason` is empty on a clean exit and describes the failure otherwise.
 */
    struct CommandResult {
      int exitCode{ -1 };
      std::string out;
      std::string err;
      bool timedOut{ false };
      bool spawnFailed{ false };
      std::string reason;

      bool ok() const { return exitCode == 0 && !timedOut && !spawnFailed; }

      static CommandResult exited(int code, std::string out = {}, std::string err = {}) {
        CommandResult r;
        r.exitCode = code;
        r.out = std::move(out);
        r.err = std::move(err);
        if (code != 0)
          r.reason = "exit_code:" + std::to_string(code);
        return r;
      }

      static CommandResult failedToSpawn(std::string why) {
        CommandResult r;
        r.spawnFailed = true;
        r.reason = std::move(why);
        return r;
      }
    };

  } // namespace io
} // namespace deskctl
