#include <gtest/gtest.h>

#include <thread>

#include "core/bootstrap_supervisor.h"
#include "fakes.h"
#include "temp_dir.h"

using namespace ksboot;
using ksboot::testing::FakeHealthProbe;
using ksboot::testing::FakeLauncher;
using ksboot::testing::RecordingWindow;
using ksboot::testing::TempDir;
using ksboot::testing::writeFile;
using namespace std::chrono_literals;

namespace {

SupervisorOptions fastOptions(int max_attempts = 20) {
    SupervisorOptions options;
    options.port = 3000;
    options.startup_delay = 0ms;
    options.poll_interval = 1ms;
    options.probe_timeout = 10ms;
    options.max_poll_attempts = max_attempts;
    return options;
}

class BootstrapSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override { window.readiness = &readiness; }

    LaunchPlanInput planWithManifest() {
        writeFile(cwd.path / "package.json", "{}");
        return emptyPlan();
    }

    LaunchPlanInput emptyPlan() {
        LaunchPlanInput plan;
        plan.bases = {cwd.path};
        plan.current_dir = cwd.path;
        plan.platform = Platform::Linux;
        return plan;
    }

    TempDir cwd{"supervisor"};
    FakeLauncher launcher;
    RecordingWindow window;
    ReadinessTracker readiness;
    ProcessHandle process{10ms};
};

}  // namespace

TEST_F(BootstrapSupervisorTest, ExistingServerIsReusedWithoutLaunching) {
    FakeHealthProbe probe(1);
    BootstrapSupervisor supervisor(fastOptions(), planWithManifest(), probe, launcher, window,
                                   readiness, process);
    supervisor.run();

    EXPECT_EQ(supervisor.state(), BootstrapState::Ready);
    EXPECT_TRUE(supervisor.isReady());
    EXPECT_EQ(launcher.launchCount(), 0u);
    EXPECT_EQ(probe.calls(), 1);
    ASSERT_EQ(window.navigations.size(), 1u);
    EXPECT_EQ(window.navigations[0], "http://localhost:3000");
    ASSERT_EQ(window.ready_at_navigate.size(), 1u);
    EXPECT_TRUE(window.ready_at_navigate[0]);
    EXPECT_FALSE(supervisor.launchMethod().has_value());
}

TEST_F(BootstrapSupervisorTest, LaunchesAndBecomesReadyOnLaterAttempt) {
    // Call 1 is the pre-launch probe; the server answers on poll attempt 4.
    FakeHealthProbe probe(5);
    BootstrapSupervisor supervisor(fastOptions(), planWithManifest(), probe, launcher, window,
                                   readiness, process);
    supervisor.run();

    EXPECT_EQ(supervisor.state(), BootstrapState::Ready);
    EXPECT_TRUE(readiness.isReady());
    EXPECT_EQ(supervisor.pollAttempts(), 4);
    ASSERT_EQ(launcher.specs.size(), 1u);
    EXPECT_EQ(launcher.specs[0].program, "bun");
    EXPECT_EQ(supervisor.launchMethod(), LaunchMethod::PackageManagerDev);
    EXPECT_TRUE(supervisor.serverPid().has_value());
    EXPECT_EQ(window.navigations.size(), 1u);
    ASSERT_EQ(window.ready_at_navigate.size(), 1u);
    EXPECT_TRUE(window.ready_at_navigate[0]);
    EXPECT_TRUE(window.failures.empty());
}

TEST_F(BootstrapSupervisorTest, FallsThroughToNextPackageManager) {
    FakeHealthProbe probe(2);
    launcher.failing = {"bun"};
    BootstrapSupervisor supervisor(fastOptions(), planWithManifest(), probe, launcher, window,
                                   readiness, process);
    supervisor.run();

    EXPECT_EQ(supervisor.state(), BootstrapState::Ready);
    ASSERT_EQ(launcher.specs.size(), 2u);
    EXPECT_EQ(launcher.specs[1].program, "npm");
}

TEST_F(BootstrapSupervisorTest, NothingToLaunchFailsWithoutRedirect) {
    FakeHealthProbe probe(0);
    BootstrapSupervisor supervisor(fastOptions(), emptyPlan(), probe, launcher, window,
                                   readiness, process);
    supervisor.run();

    EXPECT_EQ(supervisor.state(), BootstrapState::Failed);
    EXPECT_FALSE(supervisor.isReady());
    EXPECT_EQ(launcher.launchCount(), 0u);
    EXPECT_TRUE(window.navigations.empty());
    ASSERT_EQ(window.failures.size(), 1u);
    EXPECT_NE(supervisor.failureReason().find("package.json"), std::string::npos);
    EXPECT_FALSE(process.hasProcess());
}

TEST_F(BootstrapSupervisorTest, AllSpawnsFailingReportsEachAttempt) {
    FakeHealthProbe probe(0);
    launcher.failing = {"bun", "npm"};
    BootstrapSupervisor supervisor(fastOptions(), planWithManifest(), probe, launcher, window,
                                   readiness, process);
    supervisor.run();

    EXPECT_EQ(supervisor.state(), BootstrapState::Failed);
    auto reason = supervisor.failureReason();
    EXPECT_NE(reason.find("bun"), std::string::npos);
    EXPECT_NE(reason.find("npm"), std::string::npos);
    EXPECT_TRUE(window.navigations.empty());
}

TEST_F(BootstrapSupervisorTest, PollingStopsAtAttemptCeiling) {
    FakeHealthProbe probe(0);
    BootstrapSupervisor supervisor(fastOptions(5), planWithManifest(), probe, launcher, window,
                                   readiness, process);
    supervisor.run();

    EXPECT_EQ(supervisor.state(), BootstrapState::Failed);
    EXPECT_EQ(supervisor.pollAttempts(), 5);
    EXPECT_EQ(probe.calls(), 6);
    EXPECT_NE(supervisor.failureReason().find("timed out"), std::string::npos);
    EXPECT_TRUE(window.navigations.empty());
    EXPECT_FALSE(readiness.isReady());
    // The launched process is left alone until teardown.
    ASSERT_EQ(launcher.states.size(), 1u);
    EXPECT_TRUE(launcher.states[0]->running.load());
}

TEST_F(BootstrapSupervisorTest, ShutdownStopsPollingAndKillsServer) {
    FakeHealthProbe probe(0);
    auto options = fastOptions(100000);
    options.poll_interval = 20ms;
    BootstrapSupervisor supervisor(options, planWithManifest(), probe, launcher, window,
                                   readiness, process);
    supervisor.start();

    for (int i = 0; i < 200 && supervisor.state() != BootstrapState::Polling; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(supervisor.state(), BootstrapState::Polling);

    supervisor.shutdown();

    EXPECT_EQ(supervisor.state(), BootstrapState::Failed);
    EXPECT_TRUE(process.terminated());
    ASSERT_EQ(launcher.states.size(), 1u);
    EXPECT_FALSE(launcher.states[0]->running.load());
    EXPECT_TRUE(window.failures.empty());
    EXPECT_TRUE(window.navigations.empty());
}

TEST_F(BootstrapSupervisorTest, StartRunsOnceAndSettles) {
    FakeHealthProbe probe(2);
    BootstrapSupervisor supervisor(fastOptions(), planWithManifest(), probe, launcher, window,
                                   readiness, process);
    supervisor.start();
    supervisor.start();

    ASSERT_TRUE(supervisor.waitUntilSettled(5s));
    EXPECT_EQ(supervisor.state(), BootstrapState::Ready);
    supervisor.run();
    supervisor.shutdown();
    EXPECT_EQ(launcher.launchCount(), 1u);
    EXPECT_EQ(window.navigationCount(), 1u);
}

TEST_F(BootstrapSupervisorTest, ConcurrentStartAndShutdownSettleInFailed) {
    for (int round = 0; round < 20; ++round) {
        FakeHealthProbe probe(0);
        FakeLauncher round_launcher;
        RecordingWindow round_window;
        ReadinessTracker round_readiness;
        ProcessHandle round_process{10ms};
        BootstrapSupervisor supervisor(fastOptions(100000), planWithManifest(), probe,
                                       round_launcher, round_window, round_readiness,
                                       round_process);

        std::thread starter([&]() { supervisor.start(); });
        std::thread stopper([&]() { supervisor.shutdown(); });
        starter.join();
        stopper.join();
        supervisor.shutdown();

        EXPECT_EQ(supervisor.state(), BootstrapState::Failed);
        EXPECT_TRUE(round_process.terminated());
        for (const auto& state : round_launcher.states) {
            EXPECT_FALSE(state->running.load());
        }
        EXPECT_TRUE(round_window.navigations.empty());
    }
}

TEST_F(BootstrapSupervisorTest, ServerUrlUsesConfiguredPort) {
    FakeHealthProbe probe(1);
    auto options = fastOptions();
    options.port = 3100;
    BootstrapSupervisor supervisor(options, emptyPlan(), probe, launcher, window, readiness,
                                   process);
    EXPECT_EQ(supervisor.serverUrl(), "http://localhost:3100");
    supervisor.run();
    ASSERT_EQ(window.navigations.size(), 1u);
    EXPECT_EQ(window.navigations[0], "http://localhost:3100");
}

TEST(BootstrapStateTest, Names) {
    EXPECT_EQ(bootstrapStateToString(BootstrapState::Idle), "idle");
    EXPECT_EQ(bootstrapStateToString(BootstrapState::Polling), "polling");
    EXPECT_EQ(bootstrapStateToString(BootstrapState::Failed), "failed");
}
