/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace tfc {

struct CoordinatorConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
  size_t http_threads = 16;

  // Liveness
  std::chrono::milliseconds heartbeat_timeout{60000};
  std::chrono::milliseconds sweep_interval{5000};
  std::chrono::milliseconds instance_idle_timeout{0}; // 0 disables idle expiry

  // Proxied calls
  std::chrono::milliseconds worker_call_timeout{600000};
  std::unordered_map<std::string, std::chrono::milliseconds> tool_timeouts;
  bool verify_worker_on_register = true;
  std::chrono::milliseconds health_check_timeout{10000};

  std::string tools_config;
  std::string log_file;
  std::string log_level = "info";

  std::chrono::milliseconds timeout_for(const std::string &tool_name) const;

  /**
   * @brief Reads TFC_* variables over the current values, then validates.
   * @throws std::invalid_argument on unparsable or out-of-range values.
   */
  void load_from_env();

  /**
   * @throws std::invalid_argument if the heartbeat timeout or sweep interval is not positive.
   */
  void validate() const;
  void print_config() const;
  nlohmann::json to_json() const;
};

}  // namespace tfc
