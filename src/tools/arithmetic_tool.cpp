/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "tools/arithmetic_tool.hpp"

#include "common/ids.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace tfc {

std::string ArithmeticTool::create(const std::string &instance_id,
                                   const nlohmann::json &identity) {
  std::string id = instance_id.empty() ? generate_instance_id() : instance_id;
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[id] = Session{identity, {}};
  return id;
}

static ToolResult invalid_step(const std::string &message) {
  return ToolResult{"Error: " + message, ArithmeticTool::INVALID_STEP_PENALTY,
                    nlohmann::json{{"error", message}}};
}

ToolResult ArithmeticTool::execute(const std::string &instance_id,
                                   const nlohmann::json &parameters) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.find(instance_id) == sessions_.end()) {
      throw UnknownInstance(instance_id);
    }
  }

  std::string operation = parameters.value("operation", std::string());
  if (operation.empty()) {
    return invalid_step("missing operation");
  }

  auto operand1_it = parameters.find("operand1");
  auto operand2_it = parameters.find("operand2");
  bool operand1_ok = operand1_it == parameters.end() || operand1_it->is_number();
  bool operand2_ok = operand2_it == parameters.end() || operand2_it->is_number();
  if (!operand1_ok || !operand2_ok) {
    return invalid_step("operands must be numbers");
  }
  double operand1 = operand1_it == parameters.end() ? 0.0 : operand1_it->get<double>();
  double operand2 = operand2_it == parameters.end() ? 0.0 : operand2_it->get<double>();

  double result = 0.0;
  if (operation == "add") {
    result = operand1 + operand2;
  } else if (operation == "subtract") {
    result = operand1 - operand2;
  } else if (operation == "multiply") {
    result = operand1 * operand2;
  } else if (operation == "divide") {
    if (operand2 == 0.0) {
      return invalid_step("division by zero");
    }
    result = operand1 / operand2;
  } else {
    return invalid_step("unsupported operation '" + operation + "'");
  }

  size_t step_count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(instance_id);
    if (it == sessions_.end()) {
      throw UnknownInstance(instance_id);
    }
    it->second.history.push_back(Step{operation, operand1, operand2, result});
    step_count = it->second.history.size();
  }

  return ToolResult{fmt::format("Result: {} {} {} = {}", operand1, operation, operand2, result),
                    STEP_REWARD,
                    nlohmann::json{{"operation", operation},
                                   {"operand1", operand1},
                                   {"operand2", operand2},
                                   {"result", result},
                                   {"operation_count", step_count}}};
}

bool ArithmeticTool::release(const std::string &instance_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(instance_id) > 0;
}

double ArithmeticTool::calc_reward(const std::string &instance_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(instance_id);
  if (it == sessions_.end()) {
    return 0.0;
  }
  double steps = static_cast<double>(it->second.history.size());
  return std::clamp(1.0 - (steps - 1.0) * 0.1, 0.0, 1.0);
}

size_t ArithmeticTool::instance_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<ArithmeticTool::Step> ArithmeticTool::history(const std::string &instance_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(instance_id);
  if (it == sessions_.end()) {
    throw UnknownInstance(instance_id);
  }
  return it->second.history;
}

} // namespace tfc
