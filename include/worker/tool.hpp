/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tfc {

struct ToolResult {
  std::string response;
  double reward_score = 0.0;
  nlohmann::json metrics = nlohmann::json::object();

  nlohmann::json to_json() const {
    return nlohmann::json{{"response", response}, {"reward_score", reward_score}, {"metrics", metrics}};
  }
};

class UnknownInstance : public std::runtime_error {
public:
  explicit UnknownInstance(const std::string &instance_id)
      : std::runtime_error("Unknown instance: " + instance_id) {}
};

/**
 * @brief A stateful tool hosted by a worker.
 *
 * Each instance is one session. Implementations must be safe to call from several HTTP
 * threads at once.
 */
class Tool {
public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;

  /**
   * @brief Creates session state for instance_id. Creating an existing id resets it.
   * @return The instance id.
   */
  virtual std::string create(const std::string &instance_id, const nlohmann::json &identity) = 0;

  /**
   * @throws UnknownInstance
   */
  virtual ToolResult execute(const std::string &instance_id, const nlohmann::json &parameters) = 0;

  /**
   * @return Whether the instance existed.
   */
  virtual bool release(const std::string &instance_id) = 0;

  /**
   * @brief Session-level reward. Unknown instances score 0.
   */
  virtual double calc_reward(const std::string &instance_id) = 0;

  virtual size_t instance_count() const = 0;

  const nlohmann::json &schema() const { return schema_; }
  void set_schema(nlohmann::json schema) { schema_ = std::move(schema); }

protected:
  nlohmann::json schema_ = nlohmann::json::object();
};

} // namespace tfc
