#include "tools/arithmetic_tool.hpp"
#include "worker/tool_factory.hpp"
#include <gtest/gtest.h>

#include <thread>

using namespace tfc;

class ArithmeticToolTest : public ::testing::Test {
protected:
  ArithmeticTool tool_;

  ToolResult step(const std::string &id, const std::string &op, double a, double b) {
    return tool_.execute(id, nlohmann::json{{"operation", op}, {"operand1", a}, {"operand2", b}});
  }
};

TEST_F(ArithmeticToolTest, CreateUsesGivenOrGeneratedId) {
  EXPECT_EQ(tool_.create("x", nlohmann::json::object()), "x");
  std::string generated = tool_.create("", nlohmann::json::object());
  EXPECT_FALSE(generated.empty());
  EXPECT_NE(generated, "x");
  EXPECT_EQ(tool_.instance_count(), 2);
}

TEST_F(ArithmeticToolTest, ExecutesOperations) {
  tool_.create("x", {});
  EXPECT_DOUBLE_EQ(step("x", "add", 2, 3).metrics["result"].get<double>(), 5.0);
  EXPECT_DOUBLE_EQ(step("x", "subtract", 2, 3).metrics["result"].get<double>(), -1.0);
  EXPECT_DOUBLE_EQ(step("x", "multiply", 2, 3).metrics["result"].get<double>(), 6.0);
  ToolResult div = step("x", "divide", 3, 2);
  EXPECT_DOUBLE_EQ(div.metrics["result"].get<double>(), 1.5);
  EXPECT_DOUBLE_EQ(div.reward_score, ArithmeticTool::STEP_REWARD);
  EXPECT_EQ(div.metrics["operation_count"], 4);
  EXPECT_EQ(tool_.history("x").size(), 4);
}

TEST_F(ArithmeticToolTest, InvalidInputIsPenalizedAndNotRecorded) {
  tool_.create("x", {});
  EXPECT_DOUBLE_EQ(step("x", "divide", 1, 0).reward_score, ArithmeticTool::INVALID_STEP_PENALTY);
  EXPECT_DOUBLE_EQ(step("x", "modulo", 1, 2).reward_score, ArithmeticTool::INVALID_STEP_PENALTY);
  EXPECT_DOUBLE_EQ(tool_.execute("x", nlohmann::json::object()).reward_score,
                   ArithmeticTool::INVALID_STEP_PENALTY);
  ToolResult bad = tool_.execute("x", nlohmann::json{{"operation", "add"}, {"operand1", "two"}});
  EXPECT_DOUBLE_EQ(bad.reward_score, ArithmeticTool::INVALID_STEP_PENALTY);
  EXPECT_TRUE(bad.metrics.contains("error"));
  EXPECT_TRUE(tool_.history("x").empty());
}

TEST_F(ArithmeticToolTest, ExecuteOnUnknownInstanceThrows) {
  EXPECT_THROW(step("ghost", "add", 1, 2), UnknownInstance);
}

TEST_F(ArithmeticToolTest, UnknownInstanceWinsOverInvalidParameters) {
  EXPECT_THROW(step("ghost", "divide", 1, 0), UnknownInstance);
  EXPECT_THROW(step("ghost", "modulo", 1, 2), UnknownInstance);
  EXPECT_THROW(tool_.execute("ghost", nlohmann::json::object()), UnknownInstance);
}

TEST_F(ArithmeticToolTest, SessionRewardDecreasesWithSteps) {
  EXPECT_DOUBLE_EQ(tool_.calc_reward("ghost"), 0.0);
  tool_.create("x", {});
  EXPECT_DOUBLE_EQ(tool_.calc_reward("x"), 1.0);
  step("x", "add", 1, 1);
  EXPECT_DOUBLE_EQ(tool_.calc_reward("x"), 1.0);
  step("x", "add", 1, 1);
  step("x", "add", 1, 1);
  EXPECT_NEAR(tool_.calc_reward("x"), 0.8, 1e-9);
  for (int i = 0; i < 20; ++i) {
    step("x", "add", 1, 1);
  }
  EXPECT_DOUBLE_EQ(tool_.calc_reward("x"), 0.0);
}

TEST_F(ArithmeticToolTest, ReleaseDropsSession) {
  tool_.create("x", {});
  EXPECT_TRUE(tool_.release("x"));
  EXPECT_FALSE(tool_.release("x"));
  EXPECT_EQ(tool_.instance_count(), 0);
  EXPECT_THROW(step("x", "add", 1, 2), UnknownInstance);
}

TEST_F(ArithmeticToolTest, SessionsAreIsolatedUnderConcurrency) {
  for (int i = 0; i < 4; ++i) {
    tool_.create("s" + std::to_string(i), {});
  }
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([this, i]() {
      for (int k = 0; k < 50; ++k) {
        step("s" + std::to_string(i), "add", i, k);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(tool_.history("s" + std::to_string(i)).size(), 50);
  }
}

TEST(ToolFactoryTest, CreatesRegisteredToolsByShortName) {
  ToolFactory factory;
  factory.register_defaults();
  EXPECT_TRUE(factory.has("ArithmeticTool"));
  EXPECT_TRUE(factory.has("some.module.ArithmeticTool"));
  EXPECT_EQ(factory.available(), std::vector<std::string>{"ArithmeticTool"});

  ToolDefinition def;
  def.class_name = "bootcamps.example.ArithmeticTool";
  def.tool_schema = nlohmann::json{{"type", "function"}};
  std::unique_ptr<Tool> tool = factory.create(def);
  EXPECT_EQ(tool->name(), "ArithmeticTool");
  EXPECT_EQ(tool->schema()["type"], "function");

  def.class_name = "UnknownTool";
  EXPECT_THROW(factory.create(def), std::invalid_argument);
}
