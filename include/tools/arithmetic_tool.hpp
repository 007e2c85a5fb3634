/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "worker/tool.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfc {

/**
 * @brief Sample session tool: add, subtract, multiply and divide with per-instance history.
 *
 * execute parameters: {"operation": "add|subtract|multiply|divide", "operand1": n,
 * "operand2": n}. A valid step earns 0.1, invalid input -0.1. The session reward is
 * clamp(1 - 0.1 * (steps - 1), 0, 1) so shorter solutions score higher.
 */
class ArithmeticTool : public Tool {
public:
  struct Step {
    std::string operation;
    double operand1;
    double operand2;
    double result;
  };

  static constexpr double STEP_REWARD = 0.1;
  static constexpr double INVALID_STEP_PENALTY = -0.1;

  std::string name() const override { return "ArithmeticTool"; }

  std::string create(const std::string &instance_id, const nlohmann::json &identity) override;
  ToolResult execute(const std::string &instance_id, const nlohmann::json &parameters) override;
  bool release(const std::string &instance_id) override;
  double calc_reward(const std::string &instance_id) override;
  size_t instance_count() const override;

  std::vector<Step> history(const std::string &instance_id) const;

private:
  struct Session {
    nlohmann::json identity;
    std::vector<Step> history;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Session> sessions_;
};

} // namespace tfc
