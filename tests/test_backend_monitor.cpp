#include <gtest/gtest.h>
#include "hc/backend_monitor.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <set>
#include <thread>

using namespace hc;
using namespace std::chrono_literals;

namespace {

const std::string kS1 = "http://10.0.0.1:8080";
const std::string kS2 = "http://10.0.0.2:8080";
const std::string kS3 = "http://10.0.0.3:8080";

} // namespace

class BackendMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        lb = std::make_shared<test::FakeLoadBalancer>(std::vector<std::string>{kS1, kS2});
    }

    std::unique_ptr<BackendMonitor> make_monitor(std::chrono::milliseconds interval = 1000ms) {
        BackendHealthCheck config;
        config.path = "/health";
        config.interval = interval;
        config.request_timeout = 500ms;
        config.load_balancer = lb;
        return std::make_unique<BackendMonitor>("api", config, probe.function());
    }

    std::set<std::string> disabled(const BackendMonitor& monitor) {
        const auto& d = monitor.disabled_servers();
        return {d.begin(), d.end()};
    }

    std::shared_ptr<test::FakeLoadBalancer> lb;
    test::ScriptedProbe probe;
};

TEST_F(BackendMonitorTest, FailingServerIsDisabledAfterOnePass) {
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor();

    monitor->check_backend();

    EXPECT_EQ(lb->live(), std::set<std::string>{kS1});
    EXPECT_EQ(disabled(*monitor), std::set<std::string>{kS2});
}

TEST_F(BackendMonitorTest, RecoveredServerIsReenabledWithWeightOne) {
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor();
    monitor->check_backend();

    probe.set_healthy(kS2, true);
    monitor->check_backend();

    EXPECT_EQ(lb->live(), (std::set<std::string>{kS1, kS2}));
    EXPECT_TRUE(monitor->disabled_servers().empty());
    EXPECT_EQ(lb->upsert_weights(), std::vector<unsigned>{1});
}

TEST_F(BackendMonitorTest, ProbeUsesConfiguredPath) {
    auto monitor = make_monitor();
    monitor->check_backend();

    auto paths = probe.paths();
    ASSERT_EQ(paths.size(), 2);
    EXPECT_TRUE(std::all_of(paths.begin(), paths.end(), [](const auto& p) { return p == "/health"; }));
}

TEST_F(BackendMonitorTest, StillFailingServerStaysDisabledOnce) {
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor();

    for (int i = 0; i < 4; ++i) {
        monitor->check_backend();
    }

    EXPECT_EQ(monitor->disabled_servers(), std::vector<std::string>{kS2});
    EXPECT_EQ(lb->live(), std::set<std::string>{kS1});
    EXPECT_EQ(probe.calls(kS2), 4);
}

TEST_F(BackendMonitorTest, FailedReenableIsNotProbedTwiceInOnePass) {
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor();
    monitor->check_backend();
    EXPECT_EQ(probe.calls(kS2), 1);

    monitor->check_backend();
    EXPECT_EQ(probe.calls(kS2), 2);
}

TEST_F(BackendMonitorTest, ReenabledServerIsNotReprobedInSamePass) {
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor();
    monitor->check_backend();

    probe.set_healthy(kS2, true);
    monitor->check_backend();

    EXPECT_EQ(probe.calls(kS2), 2);
}

TEST_F(BackendMonitorTest, HealthyServersAreNotDuplicated) {
    auto monitor = make_monitor();
    for (int i = 0; i < 3; ++i) {
        monitor->check_backend();
    }

    EXPECT_EQ(lb->live_count(), 2);
    EXPECT_EQ(lb->mutations(), 0);
    EXPECT_TRUE(monitor->disabled_servers().empty());
}

TEST_F(BackendMonitorTest, NeverBothLiveAndDisabled) {
    lb = std::make_shared<test::FakeLoadBalancer>(std::vector<std::string>{kS1, kS2, kS3});
    auto monitor = make_monitor();

    std::vector<std::set<std::string>> failing_rounds = {
        {kS1}, {kS1, kS2}, {}, {kS3}, {kS1, kS2, kS3}, {kS2}};

    for (const auto& failing : failing_rounds) {
        for (const auto& url : {kS1, kS2, kS3}) {
            probe.set_healthy(url, !failing.contains(url));
        }
        monitor->check_backend();

        auto live = lb->live();
        auto off = disabled(*monitor);
        EXPECT_EQ(off.size(), monitor->disabled_servers().size());
        for (const auto& url : {kS1, kS2, kS3}) {
            EXPECT_NE(live.contains(url), off.contains(url)) << url;
        }
    }
}

TEST_F(BackendMonitorTest, LiveListIsQueriedEveryPass) {
    auto monitor = make_monitor();
    monitor->check_backend();
    monitor->check_backend();
    EXPECT_EQ(lb->servers_calls(), 2);

    // A server added behind the monitor's back is picked up on the next pass
    ASSERT_TRUE(lb->upsert_server(kS3, 1).has_value());
    probe.set_healthy(kS3, false);
    monitor->check_backend();
    EXPECT_EQ(disabled(*monitor), std::set<std::string>{kS3});
}

TEST_F(BackendMonitorTest, EmptyBackendIsNoop) {
    lb = std::make_shared<test::FakeLoadBalancer>();
    auto monitor = make_monitor();
    monitor->check_backend();

    EXPECT_EQ(probe.total_calls(), 0);
    EXPECT_EQ(lb->mutations(), 0);
    EXPECT_TRUE(monitor->disabled_servers().empty());
}

TEST_F(BackendMonitorTest, FailedRemoveStillRecordsDisabled) {
    probe.set_healthy(kS2, false);
    lb->set_fail_remove(true);
    auto monitor = make_monitor();

    monitor->check_backend();
    EXPECT_EQ(monitor->disabled_servers(), std::vector<std::string>{kS2});

    // Next pass retries the removal without duplicating the entry
    lb->set_fail_remove(false);
    monitor->check_backend();
    EXPECT_EQ(lb->live(), std::set<std::string>{kS1});
    EXPECT_EQ(monitor->disabled_servers(), std::vector<std::string>{kS2});
    EXPECT_EQ(probe.calls(kS2), 2);
}

TEST_F(BackendMonitorTest, FailedUpsertKeepsServerDisabled) {
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor();
    monitor->check_backend();

    probe.set_healthy(kS2, true);
    lb->set_fail_upsert(true);
    monitor->check_backend();
    EXPECT_EQ(monitor->disabled_servers(), std::vector<std::string>{kS2});
    EXPECT_EQ(lb->live(), std::set<std::string>{kS1});

    lb->set_fail_upsert(false);
    monitor->check_backend();
    EXPECT_TRUE(monitor->disabled_servers().empty());
    EXPECT_EQ(lb->live(), (std::set<std::string>{kS1, kS2}));
}

TEST_F(BackendMonitorTest, RunChecksImmediately) {
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor(60s);

    auto start = std::chrono::steady_clock::now();
    std::jthread worker([&](std::stop_token token) { monitor->run(token); });

    ASSERT_TRUE(test::wait_for([&] { return lb->live_count() == 1; }));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(BackendMonitorTest, RunRechecksOnInterval) {
    auto monitor = make_monitor(50ms);
    std::jthread worker([&](std::stop_token token) { monitor->run(token); });

    ASSERT_TRUE(test::wait_for([&] { return lb->servers_calls() >= 4; }));
}

TEST_F(BackendMonitorTest, RunStopsPromptlyOnCancellation) {
    auto monitor = make_monitor(60s);
    std::jthread worker([&](std::stop_token token) { monitor->run(token); });
    ASSERT_TRUE(test::wait_for([&] { return lb->servers_calls() == 1; }));

    auto start = std::chrono::steady_clock::now();
    worker.request_stop();
    worker.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(lb->servers_calls(), 1);
}

TEST_F(BackendMonitorTest, ApiScenario) {
    // S1 answers 200, S2 times out
    probe.set_healthy(kS1, true);
    probe.set_healthy(kS2, false);
    auto monitor = make_monitor(1000ms);

    monitor->check_backend();
    EXPECT_EQ(lb->live(), std::set<std::string>{kS1});
    EXPECT_EQ(disabled(*monitor), std::set<std::string>{kS2});

    probe.set_healthy(kS2, true);
    monitor->check_backend();
    EXPECT_EQ(lb->live(), (std::set<std::string>{kS1, kS2}));
    EXPECT_TRUE(monitor->disabled_servers().empty());
}
