#include "coordinator/health_monitor.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace tfc;
using tfc::test_support::FakeWorkerTransport;
using tfc::test_support::make_registration;
using tfc::test_support::ManualClock;

class HealthMonitorTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.heartbeat_timeout = std::chrono::seconds(60);
    config_.sweep_interval = std::chrono::milliseconds(10);
  }

  std::string create(const std::string &tool, const std::string &instance_id) {
    InstanceReservation r = registry_.reserve_instance(tool, instance_id);
    registry_.commit_instance(r);
    return r.worker_id;
  }

  ManualClock clock_;
  WorkerRegistry registry_{clock_.source()};
  FakeWorkerTransport transport_;
  CoordinatorConfig config_;
  Logger logger_{"health_monitor_test", "", LogLevel::warn};
};

TEST_F(HealthMonitorTest, SweepKeepsFreshWorkers) {
  HealthMonitor monitor(registry_, transport_, config_, logger_);
  registry_.register_worker(make_registration("a", "http://a:1", {"calc"}));
  clock_.advance(std::chrono::seconds(59));

  SweepReport report = monitor.sweep_once();
  EXPECT_TRUE(report.offline.empty());
  EXPECT_TRUE(report.evicted.empty());
  EXPECT_EQ(registry_.worker_count(), 1);
  EXPECT_EQ(monitor.sweeps_completed(), 1);
}

TEST_F(HealthMonitorTest, SweepEvictsSilentWorkerAndItsInstances) {
  HealthMonitor monitor(registry_, transport_, config_, logger_);
  registry_.register_worker(make_registration("a", "http://a:1", {"calc"}));
  registry_.register_worker(make_registration("b", "http://b:1", {"calc"}));
  registry_.bind_instance("x", "a", "calc");
  registry_.bind_instance("y", "b", "calc");

  clock_.advance(std::chrono::seconds(30));
  registry_.heartbeat("b");
  clock_.advance(std::chrono::seconds(31));

  SweepReport report = monitor.sweep_once();
  EXPECT_EQ(report.offline, std::vector<std::string>{"a"});
  ASSERT_EQ(report.evicted.count("a"), 1);
  EXPECT_EQ(report.evicted["a"], std::vector<std::string>{"x"});

  EXPECT_FALSE(registry_.find_worker("a").has_value());
  EXPECT_THROW(registry_.route_instance("x", "calc"), InstanceNotBound);
  EXPECT_EQ(registry_.route_instance("y", "calc").worker_id, "b");
  EXPECT_EQ(registry_.pick_worker("calc"), "b");
}

TEST_F(HealthMonitorTest, LateHeartbeatAfterEvictionRequiresRegistration) {
  HealthMonitor monitor(registry_, transport_, config_, logger_);
  registry_.register_worker(make_registration("a", "http://a:1", {"calc"}));
  clock_.advance(std::chrono::seconds(61));
  monitor.sweep_once();

  EXPECT_THROW(registry_.heartbeat("a"), UnknownWorker);
  RegistrationOutcome outcome =
      registry_.register_worker(make_registration("a", "http://a:1", {"calc"}));
  EXPECT_FALSE(outcome.replaced);
  EXPECT_NO_THROW(registry_.heartbeat("a"));
}

TEST_F(HealthMonitorTest, IdleExpiryReleasesOnWorker) {
  config_.instance_idle_timeout = std::chrono::seconds(30);
  HealthMonitor monitor(registry_, transport_, config_, logger_);
  registry_.register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");

  clock_.advance(std::chrono::seconds(20));
  registry_.heartbeat("a");
  EXPECT_TRUE(monitor.sweep_once().expired.empty());

  clock_.advance(std::chrono::seconds(20));
  registry_.heartbeat("a");
  SweepReport report = monitor.sweep_once();
  ASSERT_EQ(report.expired.size(), 1);
  EXPECT_EQ(report.expired[0].mapping.instance_id, "x");
  EXPECT_FALSE(registry_.resolve_instance("x").has_value());

  auto calls = transport_.calls();
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].base_url, "http://a:1");
  EXPECT_EQ(calls[0].path, "/calc/release");
  EXPECT_EQ(calls[0].body["instance_id"], "x");
}

TEST_F(HealthMonitorTest, IdleReleaseFailureIsNotFatal) {
  config_.instance_idle_timeout = std::chrono::seconds(30);
  HealthMonitor monitor(registry_, transport_, config_, logger_);
  transport_.on("/calc/release", [](const FakeWorkerTransport::Call &) -> nlohmann::json {
    throw WorkerUnreachable("connection refused");
  });
  registry_.register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  clock_.advance(std::chrono::seconds(31));
  registry_.heartbeat("a");

  SweepReport report;
  EXPECT_NO_THROW(report = monitor.sweep_once());
  EXPECT_EQ(report.expired.size(), 1);
  EXPECT_EQ(registry_.instance_count(), 0);
}

TEST_F(HealthMonitorTest, BackgroundLoopSweepsUntilStopped) {
  HealthMonitor monitor(registry_, transport_, config_, logger_);
  registry_.register_worker(make_registration("a", "http://a:1", {"calc"}));
  clock_.advance(std::chrono::seconds(61));

  monitor.start();
  EXPECT_TRUE(monitor.is_running());
  for (int i = 0; i < 500 && registry_.worker_count() > 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(registry_.worker_count(), 0);

  monitor.stop();
  EXPECT_FALSE(monitor.is_running());
  size_t sweeps = monitor.sweeps_completed();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(monitor.sweeps_completed(), sweeps);
}

TEST_F(HealthMonitorTest, CanRestartAfterStop) {
  HealthMonitor monitor(registry_, transport_, config_, logger_);
  monitor.start();
  monitor.stop();
  monitor.start();
  size_t before = monitor.sweeps_completed();
  for (int i = 0; i < 500 && monitor.sweeps_completed() == before; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_GT(monitor.sweeps_completed(), before);
  monitor.stop();
}

TEST_F(HealthMonitorTest, SweepNeverEvictsWorkerThatRegisteredAgain) {
  std::atomic<long long> now_ms{3600000};
  WorkerRegistry registry([&now_ms] { return SteadyTime(std::chrono::milliseconds(now_ms.load())); });
  HealthMonitor monitor(registry, transport_, config_, logger_);

  std::atomic<bool> done{false};
  std::thread sweeper([&]() {
    while (!done.load()) {
      monitor.sweep_once();
    }
  });

  for (int i = 0; i < 500; ++i) {
    // every earlier heartbeat is now stale
    now_ms += 2 * config_.heartbeat_timeout.count();
    registry.register_worker(make_registration("a", "http://a:1", {"calc"}));
    if (!registry.resolve_instance("x")) {
      registry.bind_instance("x", "a", "calc");
    }

    // fresh at the current time: no sweep may remove it until the clock moves again
    auto record = registry.find_worker("a");
    std::string owner = registry.resolve_instance("x").value_or("");
    if (!record || record->status != WorkerStatus::ONLINE || owner != "a") {
      ADD_FAILURE() << "worker a or its binding lost in iteration " << i;
      break;
    }
  }

  done.store(true);
  sweeper.join();
}
