#include "coordinator/coordinator.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <thread>

using namespace tfc;
using tfc::test_support::FakeWorkerTransport;
using tfc::test_support::make_registration;
using tfc::test_support::ManualClock;

class CoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    CoordinatorConfig config;
    config.heartbeat_timeout = std::chrono::seconds(60);
    config.worker_call_timeout = std::chrono::seconds(600);
    config.tool_timeouts["slow"] = std::chrono::seconds(5);
    config.log_level = "warn";

    auto transport = std::make_unique<FakeWorkerTransport>();
    transport_ = transport.get();
    coordinator_ = std::make_unique<Coordinator>(config, std::move(transport), clock_.source());
  }

  nlohmann::json create(const std::string &tool, const std::string &instance_id = "") {
    CreateRequest request;
    request.instance_id = instance_id;
    return coordinator_->create_instance(tool, request);
  }

  ManualClock clock_;
  FakeWorkerTransport *transport_ = nullptr;
  std::unique_ptr<Coordinator> coordinator_;
};

TEST_F(CoordinatorTest, RegisterChecksWorkerHealthAndNormalizesUrl) {
  RegistrationOutcome outcome =
      coordinator_->register_worker(make_registration("a", "http://a:1/", {"calc"}));
  EXPECT_EQ(outcome.worker_id, "a");
  EXPECT_EQ(transport_->health_checked(), std::vector<std::string>{"http://a:1"});
  EXPECT_EQ(coordinator_->registry().find_worker("a")->base_url, "http://a:1");
}

TEST_F(CoordinatorTest, UnreachableWorkerIsRejected) {
  transport_->set_unreachable("http://a:1");
  EXPECT_THROW(coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"})),
               WorkerUnreachable);
  EXPECT_EQ(coordinator_->registry().worker_count(), 0);
}

TEST_F(CoordinatorTest, InvalidRegistrationIsRejectedBeforeHealthCheck) {
  EXPECT_THROW(coordinator_->register_worker(make_registration("a", "http://a:1", {})),
               ValidationError);
  EXPECT_TRUE(transport_->health_checked().empty());
}

TEST_F(CoordinatorTest, CreateForwardsToChosenWorkerAndBinds) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  CreateRequest request;
  request.instance_id = "x";
  request.identity = nlohmann::json{{"session", 7}};

  nlohmann::json reply = coordinator_->create_instance("calc", request);
  EXPECT_TRUE(reply["success"].get<bool>());
  EXPECT_EQ(reply["instance_id"], "x");
  EXPECT_EQ(reply["worker_id"], "a");
  EXPECT_FALSE(reply["existing"].get<bool>());

  auto calls = transport_->calls();
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].base_url, "http://a:1");
  EXPECT_EQ(calls[0].path, "/calc/create");
  EXPECT_EQ(calls[0].body["instance_id"], "x");
  EXPECT_EQ(calls[0].body["identity"]["session"], 7);
  EXPECT_EQ(calls[0].timeout, std::chrono::seconds(600));
  EXPECT_EQ(coordinator_->registry().resolve_instance("x").value(), "a");
}

TEST_F(CoordinatorTest, CreateWithoutIdGeneratesOne) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  nlohmann::json reply = create("calc");
  std::string id = reply["instance_id"].get<std::string>();
  EXPECT_EQ(id.size(), 36);
  EXPECT_EQ(transport_->calls()[0].body["instance_id"], id);
}

TEST_F(CoordinatorTest, CreateWithoutWorkersFails) {
  EXPECT_THROW(create("calc"), NoWorkerAvailable);
  EXPECT_TRUE(transport_->calls().empty());
}

TEST_F(CoordinatorTest, DuplicateCreateReturnsExistingBinding) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  coordinator_->register_worker(make_registration("b", "http://b:1", {"calc"}));
  std::string owner = create("calc", "x")["worker_id"].get<std::string>();

  nlohmann::json again = create("calc", "x");
  EXPECT_TRUE(again["existing"].get<bool>());
  EXPECT_EQ(again["worker_id"], owner);
  EXPECT_EQ(transport_->count_calls("/calc/create"), 1);
  EXPECT_EQ(coordinator_->registry().find_worker(owner)->active_instance_count, 1);
}

TEST_F(CoordinatorTest, FailedCreateRollsBack) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  transport_->on("/calc/create", [](const FakeWorkerTransport::Call &) {
    return nlohmann::json{{"success", false}, {"error", "tool exploded"}};
  });

  try {
    create("calc", "x");
    FAIL() << "create should have failed";
  } catch (const WorkerError &e) {
    EXPECT_STREQ(e.what(), "tool exploded");
  }
  EXPECT_EQ(coordinator_->registry().instance_count(), 0);
  EXPECT_EQ(coordinator_->registry().find_worker("a")->active_instance_count, 0);
}

TEST_F(CoordinatorTest, CreateTimeoutRollsBackWithoutEvicting) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  transport_->on("/calc/create", [](const FakeWorkerTransport::Call &) -> nlohmann::json {
    throw WorkerTimeout("too slow");
  });

  EXPECT_THROW(create("calc", "x"), WorkerTimeout);
  EXPECT_EQ(coordinator_->registry().instance_count(), 0);
  EXPECT_TRUE(coordinator_->registry().find_worker("a").has_value());
}

TEST_F(CoordinatorTest, ExecuteForwardsVerbatimToBoundWorker) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  coordinator_->register_worker(make_registration("b", "http://b:1", {"calc"}));
  transport_->on("/calc/execute", [](const FakeWorkerTransport::Call &call) {
    return nlohmann::json{{"response", "ok from " + call.base_url},
                          {"reward_score", 0.1},
                          {"metrics", call.body["parameters"]}};
  });

  nlohmann::json body{{"instance_id", "x"}, {"parameters", {{"operation", "add"}}}};
  for (int i = 0; i < 3; ++i) {
    nlohmann::json reply = coordinator_->execute("calc", body);
    EXPECT_EQ(reply["response"], "ok from http://a:1");
    EXPECT_EQ(reply["metrics"]["operation"], "add");
  }
  auto calls = transport_->calls();
  EXPECT_EQ(calls.back().body, body);
}

TEST_F(CoordinatorTest, ExecuteRequiresInstanceId) {
  EXPECT_THROW(coordinator_->execute("calc", nlohmann::json::object()), ValidationError);
  EXPECT_THROW(coordinator_->execute("calc", nlohmann::json{{"instance_id", 3}}),
               ValidationError);
}

TEST_F(CoordinatorTest, ExecuteUnknownInstanceIsNotRerouted) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  EXPECT_THROW(coordinator_->execute("calc", nlohmann::json{{"instance_id", "never"}}),
               InstanceNotBound);
  EXPECT_TRUE(transport_->calls().empty());
}

TEST_F(CoordinatorTest, ExecuteAfterEvictionIsNotBound) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  coordinator_->register_worker(make_registration("b", "http://b:1", {"calc"}));
  create("calc", "x");
  std::string owner = coordinator_->registry().resolve_instance("x").value();
  std::string other = owner == "a" ? "b" : "a";

  clock_.advance(std::chrono::seconds(30));
  coordinator_->heartbeat(other);
  clock_.advance(std::chrono::seconds(31));
  coordinator_->health_monitor().sweep_once();

  EXPECT_THROW(coordinator_->execute("calc", nlohmann::json{{"instance_id", "x"}}),
               InstanceNotBound);
  EXPECT_EQ(transport_->count_calls("/calc/execute"), 0);
}

TEST_F(CoordinatorTest, ExecuteTimeoutDoesNotEvict) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"slow"}));
  create("slow", "x");
  transport_->on("/slow/execute", [](const FakeWorkerTransport::Call &) -> nlohmann::json {
    throw WorkerTimeout("deadline exceeded");
  });

  try {
    coordinator_->execute("slow", nlohmann::json{{"instance_id", "x"}});
    FAIL() << "execute should have timed out";
  } catch (const WorkerTimeout &e) {
    EXPECT_TRUE(e.retryable());
    EXPECT_EQ(e.http_status(), 504);
  }
  EXPECT_EQ(transport_->calls().back().timeout, std::chrono::seconds(5));
  EXPECT_EQ(coordinator_->registry().resolve_instance("x").value(), "a");
  EXPECT_TRUE(coordinator_->registry().find_worker("a").has_value());
}

TEST_F(CoordinatorTest, ExecuteThroughOtherToolRouteIsRejected) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc", "search"}));
  create("calc", "x");
  EXPECT_THROW(coordinator_->execute("search", nlohmann::json{{"instance_id", "x"}}),
               InstanceNotBound);
}

TEST_F(CoordinatorTest, CalcRewardRoutesWithAffinity) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  transport_->on("/calc/calc_reward", [](const FakeWorkerTransport::Call &) {
    return nlohmann::json{{"reward_score", 0.8}};
  });
  nlohmann::json reply = coordinator_->calc_reward("calc", nlohmann::json{{"instance_id", "x"}});
  EXPECT_DOUBLE_EQ(reply["reward_score"].get<double>(), 0.8);
}

TEST_F(CoordinatorTest, ReleaseRemovesBinding) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  coordinator_->release("calc", nlohmann::json{{"instance_id", "x"}});
  EXPECT_EQ(transport_->count_calls("/calc/release"), 1);
  EXPECT_FALSE(coordinator_->registry().resolve_instance("x").has_value());
  EXPECT_EQ(coordinator_->registry().find_worker("a")->active_instance_count, 0);
  EXPECT_THROW(coordinator_->release("calc", nlohmann::json{{"instance_id", "x"}}),
               InstanceNotBound);
}

TEST_F(CoordinatorTest, ReleaseRemovesBindingEvenWhenWorkerFails) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  transport_->on("/calc/release", [](const FakeWorkerTransport::Call &) -> nlohmann::json {
    throw WorkerUnreachable("connection reset");
  });
  EXPECT_THROW(coordinator_->release("calc", nlohmann::json{{"instance_id", "x"}}),
               WorkerUnreachable);
  EXPECT_EQ(coordinator_->registry().instance_count(), 0);
}

TEST_F(CoordinatorTest, ReleaseThroughOtherToolRouteKeepsBinding) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc", "search"}));
  create("calc", "y");
  EXPECT_THROW(coordinator_->release("search", nlohmann::json{{"instance_id", "y"}}),
               InstanceNotBound);
  EXPECT_EQ(coordinator_->registry().resolve_instance("y").value(), "a");
  EXPECT_EQ(coordinator_->registry().find_worker("a")->active_instance_count, 1);
  EXPECT_EQ(transport_->count_calls("/search/release"), 0);
  EXPECT_EQ(transport_->count_calls("/calc/release"), 0);
}

TEST_F(CoordinatorTest, ReleaseOfInstanceOnOfflineWorkerDropsBinding) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  clock_.advance(std::chrono::seconds(61));
  coordinator_->registry().mark_stale(std::chrono::seconds(60));
  EXPECT_THROW(coordinator_->release("calc", nlohmann::json{{"instance_id", "x"}}),
               InstanceNotBound);
  EXPECT_EQ(coordinator_->registry().instance_count(), 0);
  EXPECT_EQ(transport_->count_calls("/calc/release"), 0);
}

TEST_F(CoordinatorTest, ConcurrentCreatesStayBalanced) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  coordinator_->register_worker(make_registration("b", "http://b:1", {"calc"}));

  const int num_threads = 8;
  const int per_thread = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this]() {
      for (int i = 0; i < per_thread; ++i) {
        create("calc");
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  size_t a = coordinator_->registry().find_worker("a")->active_instance_count;
  size_t b = coordinator_->registry().find_worker("b")->active_instance_count;
  EXPECT_EQ(a + b, static_cast<size_t>(num_threads * per_thread));
  EXPECT_LE(std::max(a, b) - std::min(a, b), 1u);
  EXPECT_EQ(coordinator_->registry().instance_count(), a + b);
  EXPECT_EQ(transport_->count_calls("/calc/create"), a + b);
}

TEST_F(CoordinatorTest, ThreeCreatesSpreadOverTwoWorkers) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  coordinator_->register_worker(make_registration("b", "http://b:1", {"calc"}));
  std::map<std::string, int> per_worker;
  for (int i = 0; i < 3; ++i) {
    per_worker[create("calc")["worker_id"].get<std::string>()]++;
  }
  EXPECT_LE(per_worker["a"], 2);
  EXPECT_LE(per_worker["b"], 2);
}

TEST_F(CoordinatorTest, UnregisterInvalidatesInstances) {
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  EXPECT_EQ(coordinator_->unregister_worker("a"), std::vector<std::string>{"x"});
  EXPECT_THROW(coordinator_->unregister_worker("a"), UnknownWorker);
  EXPECT_THROW(coordinator_->heartbeat("a"), UnknownWorker);
}

TEST_F(CoordinatorTest, HealthReportsSnapshot) {
  coordinator_->declare_tools({"calc", "search"});
  coordinator_->register_worker(make_registration("a", "http://a:1", {"calc"}));
  create("calc", "x");
  nlohmann::json health = coordinator_->health();
  EXPECT_EQ(health["status"], "ok");
  EXPECT_EQ(health["online_workers"], 1);
  EXPECT_EQ(health["instances"]["x"]["worker_id"], "a");
  EXPECT_TRUE(health["tools"].contains("search"));
  EXPECT_EQ(health["heartbeat_timeout_ms"], 60000);
}

TEST(CreateRequestTest, ParsesOptionalFields) {
  CreateRequest empty = CreateRequest::from_json(nlohmann::json::object());
  EXPECT_TRUE(empty.instance_id.empty());
  EXPECT_TRUE(empty.identity.is_object());

  CreateRequest full =
      CreateRequest::from_json(nlohmann::json{{"instance_id", "x"}, {"identity", {{"k", 1}}}});
  EXPECT_EQ(full.instance_id, "x");
  EXPECT_EQ(full.identity["k"], 1);

  EXPECT_THROW(CreateRequest::from_json(nlohmann::json{{"instance_id", 5}}), ValidationError);
  EXPECT_THROW(CreateRequest::from_json(nlohmann::json::array()), ValidationError);
}
