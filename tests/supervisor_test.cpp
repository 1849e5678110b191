// deskctl headers
#include "core/Logger.hpp"
#include "core/ModeApplicator.hpp"
#include "core/ReadinessProber.hpp"
#include "core/ServiceRegistry.hpp"
#include "core/SupervisorClient.hpp"
#include "io/ProcessRunner.hpp"

// deskctl-Fake headers
#include "FakeProcessRunner.hpp"
#include "TempFile.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <memory>
#include <stdexcept>

namespace deskctl::test {

  using core::Logger;
  using core::Mode;
  using core::ModeApplicator;
  using core::ModeSettings;
  using core::ReadinessProber;
  using core::ReadinessSettings;
  using core::ServiceRegistry;
  using core::StackHealth;
  using core::SupervisorClient;
  using core::SupervisorSettings;
  using io::CommandResult;
  using io::CommandSpec;
  using std::chrono::milliseconds;
  using namespace std::chrono_literals;

  using ::testing::_;
  using ::testing::AllOf;
  using ::testing::ElementsAre;
  using ::testing::Field;
  using ::testing::InSequence;
  using ::testing::Return;

  class MockProcessRunner : public io::ProcessRunner {
  public:
    MOCK_METHOD(CommandResult, run, (const CommandSpec&), (override));
  };

  // ---------------------------------------------------------------------------
  // SupervisorClient: exact command lines
  // ---------------------------------------------------------------------------

  class SupervisorClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
      runner = std::make_shared<testing::StrictMock<MockProcessRunner>>();
      settings.command = "/usr/bin/supervisorctl";
      settings.statusTimeout = 5000ms;
      settings.controlTimeout = 10000ms;
      client = std::make_unique<SupervisorClient>(runner, registry, settings, log);
    }

    Logger log;
    ServiceRegistry registry{ "xfce", "plank" };
    SupervisorSettings settings;
    std::shared_ptr<testing::StrictMock<MockProcessRunner>> runner;
    std::unique_ptr<SupervisorClient> client;
  };

  TEST_F(SupervisorClientTest, statusSnapshot_RunsStatusWithStatusTimeout) {
    EXPECT_CALL(*runner, run(AllOf(Field(&CommandSpec::argv, ElementsAre("/usr/bin/supervisorctl", "status")),
                                   Field(&CommandSpec::timeout, milliseconds(5000)))))
        .WillOnce(Return(CommandResult::exited(0, "xfce   RUNNING   pid 1, uptime 1:00:00\n"
                                                  "plank  STOPPED   Not started\n")));

    auto snap = client->statusSnapshot();
    EXPECT_EQ(snap.stateOf("xfce"), "RUNNING");
    EXPECT_EQ(snap.stateOf("plank"), "STOPPED");
    EXPECT_EQ(client->health(snap), StackHealth::NotRunning);
    EXPECT_FALSE(client->stackRunning(snap));
  }

  TEST_F(SupervisorClientTest, statusSnapshot_FailureYieldsEmptySnapshotAndFailsOpen) {
    EXPECT_CALL(*runner, run(_)).WillOnce(Return(CommandResult::exited(3, "xfce STOPPED\n")));

    auto snap = client->statusSnapshot();
    EXPECT_TRUE(snap.empty());
    EXPECT_EQ(client->health(snap), StackHealth::Unknown);
    EXPECT_TRUE(client->stackRunning(snap));
  }

  TEST_F(SupervisorClientTest, statusSnapshot_TimeoutYieldsEmptySnapshot) {
    CommandResult timedOut;
    timedOut.timedOut = true;
    timedOut.exitCode = 137;
    EXPECT_CALL(*runner, run(_)).WillOnce(Return(timedOut));
    EXPECT_TRUE(client->statusSnapshot().empty());
  }

  TEST_F(SupervisorClientTest, startAll_WmFirst_StopAll_Reverse) {
    {
      InSequence seq;
      EXPECT_CALL(*runner, run(AllOf(Field(&CommandSpec::argv, ElementsAre("/usr/bin/supervisorctl", "start", "xfce")),
                                     Field(&CommandSpec::timeout, milliseconds(10000)))))
          .WillOnce(Return(CommandResult::exited(0)));
      EXPECT_CALL(*runner, run(Field(&CommandSpec::argv, ElementsAre("/usr/bin/supervisorctl", "start", "plank"))))
          .WillOnce(Return(CommandResult::exited(0)));
      EXPECT_CALL(*runner, run(Field(&CommandSpec::argv, ElementsAre("/usr/bin/supervisorctl", "stop", "plank"))))
          .WillOnce(Return(CommandResult::exited(0)));
      EXPECT_CALL(*runner, run(Field(&CommandSpec::argv, ElementsAre("/usr/bin/supervisorctl", "stop", "xfce"))))
          .WillOnce(Return(CommandResult::exited(0)));
    }

    client->startAll();
    client->stopAll();
  }

  TEST_F(SupervisorClientTest, controlFailure_IsLoggedNotThrown) {
    EXPECT_CALL(*runner, run(_)).WillOnce(Return(CommandResult::exited(7, "", "xfce: ERROR (spawn error)")));
    EXPECT_NO_THROW(client->start("xfce"));
  }

  TEST(supervisor_client, rejects_null_runner) {
    Logger log;
    ServiceRegistry registry("xfce", "none");
    EXPECT_THROW(SupervisorClient(nullptr, registry, SupervisorSettings{}, log), std::invalid_argument);
  }

  // ---------------------------------------------------------------------------
  // ReadinessProber
  // ---------------------------------------------------------------------------

  class ReadinessProberTest : public ::testing::Test {
  protected:
    void SetUp() override {
      runner = std::make_shared<FakeProcessRunner>();
      runner->setState("xfce", "RUNNING");
      supervisor = std::make_unique<SupervisorClient>(runner, registry, SupervisorSettings{}, log);

      settings.stackPoll = 5ms;
      settings.displayPoll = 5ms;
      settings.stackWaitMax = 60ms;
      settings.displayWaitMax = 60ms;
    }

    ReadinessProber makeProber() { return ReadinessProber(*supervisor, runner, settings, log); }

    Logger log;
    ServiceRegistry registry{ "xfce", "none" };
    ReadinessSettings settings;
    std::shared_ptr<FakeProcessRunner> runner;
    std::unique_ptr<SupervisorClient> supervisor;
  };

  TEST_F(ReadinessProberTest, waitStackReady_TrueWhenRunning) {
    auto prober = makeProber();
    EXPECT_TRUE(prober.waitStackReady());
  }

  TEST_F(ReadinessProberTest, waitStackReady_FalseAfterDeadline) {
    runner->setState("xfce", "BACKOFF");
    auto prober = makeProber();

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(prober.waitStackReady(40ms));
    EXPECT_GE(std::chrono::steady_clock::now() - started, 40ms);
  }

  TEST_F(ReadinessProberTest, waitStackReady_ZeroWaitDoesNotPoll) {
    auto prober = makeProber();
    EXPECT_FALSE(prober.waitStackReady(0ms));
    EXPECT_TRUE(runner->calls().empty());
  }

  TEST_F(ReadinessProberTest, waitDisplayReady_UsesFallbackProbes) {
    auto prober = makeProber();
    EXPECT_TRUE(prober.waitDisplayReady());

    auto calls = runner->calls();
    ASSERT_FALSE(calls.empty());
    EXPECT_THAT(calls.front(), ElementsAre("xset", "q"));
  }

  TEST_F(ReadinessProberTest, waitDisplayReady_TriesEveryProbeThenGivesUp) {
    runner->displayReady = false;
    auto prober = makeProber();
    EXPECT_FALSE(prober.waitDisplayReady(30ms));

    auto calls = runner->calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_THAT(calls[0], ElementsAre("xset", "q"));
    EXPECT_THAT(calls[1], ElementsAre("xdpyinfo"));
  }

  TEST_F(ReadinessProberTest, waitDisplayReady_CustomCommandRunsThroughShell) {
    settings.displayReadyCmd = "xdpyinfo -display :0 >/dev/null";
    auto prober = makeProber();
    EXPECT_TRUE(prober.waitDisplayReady());
    EXPECT_THAT(runner->calls().front(), ElementsAre("/bin/sh", "-lc", "xdpyinfo -display :0 >/dev/null"));
  }

  TEST(readiness_prober, missing_probe_binaries_are_not_fatal) {
    Logger log;
    ServiceRegistry registry("xfce", "none");
    auto runner = std::make_shared<testing::NiceMock<MockProcessRunner>>();
    ON_CALL(*runner, run(_)).WillByDefault(Return(CommandResult::exited(io::kExitNotExecutable)));
    SupervisorClient supervisor(runner, registry, SupervisorSettings{}, log);

    ReadinessSettings settings;
    settings.displayPoll = 5ms;
    ReadinessProber prober(supervisor, runner, settings, log);
    EXPECT_FALSE(prober.waitDisplayReady(20ms));
  }

  // ---------------------------------------------------------------------------
  // ModeApplicator
  // ---------------------------------------------------------------------------

  class ModeApplicatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      runner = std::make_shared<FakeProcessRunner>();
      runner->togglePath = toggle.path();
      settings.kioskScript = toggle.path();
    }

    Logger log;
    TempFile toggle{ "deskctl-kiosk" };
    ModeSettings settings;
    std::shared_ptr<FakeProcessRunner> runner;
  };

  TEST_F(ModeApplicatorTest, apply_PassesModeArgumentAndReturnsStdout) {
    runner->toggleOut = "  kiosk enabled\n";
    ModeApplicator applicator(runner, settings, log);

    auto res = applicator.apply(Mode::On);
    EXPECT_TRUE(res.ok);
    EXPECT_EQ(res.message, "kiosk enabled");
    EXPECT_THAT(runner->toggleModes(), ElementsAre("on"));

    applicator.apply(Mode::Off);
    EXPECT_THAT(runner->toggleModes(), ElementsAre("on", "off"));
  }

  TEST_F(ModeApplicatorTest, apply_MessageFallsBackToStderrThenOk) {
    runner->toggleOut = "";
    runner->toggleErr = "warning: panel busy\n";
    ModeApplicator applicator(runner, settings, log);
    EXPECT_EQ(applicator.apply(Mode::On).message, "warning: panel busy");

    runner->toggleErr = "";
    EXPECT_EQ(applicator.apply(Mode::On).message, "ok");
  }

  TEST_F(ModeApplicatorTest, apply_NonZeroExitFails) {
    runner->toggleExit = 1;
    runner->toggleOut = "";
    runner->toggleErr = "";
    ModeApplicator applicator(runner, settings, log);

    auto res = applicator.apply(Mode::Off);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.message, "exit_code:1");
  }

  TEST_F(ModeApplicatorTest, apply_MissingToggleSpawnsNothing) {
    settings.kioskScript = "/nonexistent/kiosk_mode.sh";
    ModeApplicator applicator(runner, settings, log);

    auto res = applicator.apply(Mode::On);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.message, "missing_script:/nonexistent/kiosk_mode.sh");
    EXPECT_TRUE(runner->calls().empty());
    EXPECT_FALSE(applicator.toggleExists());
  }

  TEST_F(ModeApplicatorTest, apply_UsesConfiguredTimeout) {
    auto mock = std::make_shared<testing::StrictMock<MockProcessRunner>>();
    settings.applyTimeout = 1500ms;
    ModeApplicator applicator(mock, settings, log);

    EXPECT_CALL(*mock, run(AllOf(Field(&CommandSpec::argv, ElementsAre(toggle.path(), "off")),
                                 Field(&CommandSpec::timeout, milliseconds(1500)))))
        .WillOnce(Return(CommandResult::exited(0)));
    EXPECT_TRUE(applicator.apply(Mode::Off).ok);
  }

  TEST_F(ModeApplicatorTest, apply_UnknownModeIsRejected) {
    ModeApplicator applicator(runner, settings, log);
    EXPECT_THROW(applicator.apply(Mode::Unknown), std::invalid_argument);
  }

} // namespace deskctl::test
