// deskctl headers
#include "io/FileLogger.hpp"
#include "io/ProcessRunner.hpp"

// deskctl-Fake headers
#include "TempFile.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

using namespace deskctl::io;
using deskctl::test::TempFile;
using namespace std::chrono_literals;

namespace {

  CommandResult sh(ProcessRunner& runner, const std::string& script, std::chrono::milliseconds timeout = 5000ms) {
    return runner.run({ { "/bin/sh", "-c", script }, timeout });
  }

  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  // Restores DISPLAY as it was when the guard was created.
  class DisplayGuard {
  public:
    DisplayGuard() {
      if (const char* v = std::getenv("DISPLAY"))
        saved_ = v;
    }
    ~DisplayGuard() {
      if (saved_)
        ::setenv("DISPLAY", saved_->c_str(), 1);
      else
        ::unsetenv("DISPLAY");
    }

  private:
    std::optional<std::string> saved_;
  };

} // namespace

// ---------------------------------------------------------------------------
// ProcessRunner (real /bin/sh children)
// ---------------------------------------------------------------------------

TEST(process_runner, captures_stdout_and_exit_zero) {
  ProcessRunner runner;
  auto res = sh(runner, "echo hello");
  EXPECT_TRUE(res.ok());
  EXPECT_EQ(res.exitCode, 0);
  EXPECT_EQ(res.out, "hello\n");
  EXPECT_TRUE(res.reason.empty());
}

TEST(process_runner, captures_stderr_separately) {
  ProcessRunner runner;
  auto res = sh(runner, "echo out; echo err 1>&2");
  EXPECT_EQ(res.out, "out\n");
  EXPECT_EQ(res.err, "err\n");
}

TEST(process_runner, reports_non_zero_exit) {
  ProcessRunner runner;
  auto res = sh(runner, "exit 3");
  EXPECT_FALSE(res.ok());
  EXPECT_EQ(res.exitCode, 3);
  EXPECT_FALSE(res.timedOut);
  EXPECT_EQ(res.reason, "exit_code:3");
}

TEST(process_runner, kills_child_at_deadline) {
  ProcessRunner runner;
  auto started = std::chrono::steady_clock::now();
  auto res = sh(runner, "sleep 5", 200ms);
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_TRUE(res.timedOut);
  EXPECT_FALSE(res.ok());
  EXPECT_EQ(res.reason, "timeout after 200ms");
  EXPECT_LT(elapsed, 3s);
}

TEST(process_runner, timeout_also_reaps_grandchildren) {
  ProcessRunner runner;
  // the background sleep keeps stdout open; only a group kill lets us return
  auto started = std::chrono::steady_clock::now();
  auto res = sh(runner, "sleep 5 & wait", 200ms);
  EXPECT_TRUE(res.timedOut);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(process_runner, missing_program_exits_127) {
  ProcessRunner runner;
  auto res = runner.run({ { "/nonexistent/deskctl-helper" }, 2000ms });
  EXPECT_FALSE(res.ok());
  EXPECT_EQ(res.exitCode, kExitNotExecutable);
  EXPECT_FALSE(res.timedOut);
}

TEST(process_runner, empty_argv_is_a_spawn_failure) {
  ProcessRunner runner;
  auto res = runner.run({ {}, 1000ms });
  EXPECT_TRUE(res.spawnFailed);
  EXPECT_FALSE(res.ok());
}

TEST(process_runner, arguments_are_passed_verbatim) {
  ProcessRunner runner;
  auto res = runner.run({ { "/bin/sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "$HOME", "" }, 2000ms });
  EXPECT_EQ(res.out, "a b|$HOME||");
}

TEST(process_runner, injects_display_only_when_absent) {
  DisplayGuard guard;

  ::unsetenv("DISPLAY");
  ProcessRunner runner(":7");
  EXPECT_EQ(sh(runner, "printf %s \"$DISPLAY\"").out, ":7");

  ::setenv("DISPLAY", ":3", 1);
  EXPECT_EQ(sh(runner, "printf %s \"$DISPLAY\"").out, ":3");
}

TEST(process_runner, child_stdin_is_not_inherited) {
  ProcessRunner runner;
  auto res = sh(runner, "cat; echo done", 2000ms);
  EXPECT_FALSE(res.timedOut);
  EXPECT_EQ(res.out, "done\n");
}

// ---------------------------------------------------------------------------
// FileLogger
// ---------------------------------------------------------------------------

TEST(file_logger, appends_lines_on_flush) {
  TempFile file("deskctl-filelog", "existing\n");
  FileLogger log;
  ASSERT_TRUE(log.open(file.path()));
  log.write("first\n");
  log.write("second\n");
  EXPECT_TRUE(log.flush());
  EXPECT_EQ(slurp(file.path()), "existing\nfirst\nsecond\n");
}

TEST(file_logger, close_flushes_pending_buffer) {
  TempFile file("deskctl-filelog", "");
  {
    FileLogger log;
    ASSERT_TRUE(log.open(file.path()));
    log.write("pending\n");
  }
  EXPECT_EQ(slurp(file.path()), "pending\n");
}

TEST(file_logger, unopened_sink_ignores_writes) {
  FileLogger log;
  EXPECT_FALSE(log.isOpen());
  log.write("dropped\n");
  EXPECT_FALSE(log.flush());
  EXPECT_FALSE(log.open("/nonexistent-dir/x.log"));
}

TEST(file_logger, move_transfers_the_handle) {
  TempFile file("deskctl-filelog", "");
  FileLogger a;
  ASSERT_TRUE(a.open(file.path()));
  a.write("moved\n");

  FileLogger b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());
  b.close();
  EXPECT_EQ(slurp(file.path()), "moved\n");
}
