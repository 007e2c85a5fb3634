#include "registry/load_balancer.hpp"
#include <gtest/gtest.h>

using namespace tfc;

class LoadBalancerTest : public ::testing::Test {
protected:
  SteadyTime at(int seconds) { return SteadyTime(std::chrono::seconds(seconds)); }
};

TEST_F(LoadBalancerTest, EmptyCandidatesSelectNothing) {
  EXPECT_FALSE(LoadBalancer::select({}).has_value());
}

TEST_F(LoadBalancerTest, PicksLowestInstanceCount) {
  std::vector<WorkerLoad> candidates = {{"a", 3, at(1)}, {"b", 1, at(5)}, {"c", 2, at(0)}};
  EXPECT_EQ(LoadBalancer::select(candidates).value(), "b");
}

TEST_F(LoadBalancerTest, TiesGoToEarliestHeartbeat) {
  std::vector<WorkerLoad> candidates = {{"a", 1, at(9)}, {"b", 1, at(2)}, {"c", 4, at(0)}};
  EXPECT_EQ(LoadBalancer::select(candidates).value(), "b");
}

TEST_F(LoadBalancerTest, FullTieGoesToSmallestId) {
  std::vector<WorkerLoad> candidates = {{"w2", 0, at(3)}, {"w1", 0, at(3)}};
  EXPECT_EQ(LoadBalancer::select(candidates).value(), "w1");
}

TEST_F(LoadBalancerTest, NeverSelectsStrictlyMoreLoadedWorker) {
  std::vector<WorkerLoad> candidates;
  for (int i = 0; i < 20; ++i) {
    candidates.push_back({"w" + std::to_string(i), static_cast<size_t>((i * 7) % 5), at(i)});
  }
  std::string chosen = LoadBalancer::select(candidates).value();
  size_t chosen_count = 0;
  for (const auto &c : candidates) {
    if (c.worker_id == chosen) {
      chosen_count = c.active_instance_count;
    }
  }
  for (const auto &c : candidates) {
    EXPECT_LE(chosen_count, c.active_instance_count);
  }
}
