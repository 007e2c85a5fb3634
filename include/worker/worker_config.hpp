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

namespace tfc {

struct WorkerConfig {
  std::string host = "0.0.0.0";
  int port = 8001;
  size_t http_threads = 8;

  std::string worker_id;     // empty: assigned by the master
  std::string advertise_url; // empty: http://<external ip>:<port>
  std::string master_url = "http://127.0.0.1:8000";

  std::chrono::milliseconds heartbeat_interval{30000};
  std::chrono::milliseconds register_initial_backoff{1000};
  std::chrono::milliseconds register_max_backoff{10000};
  size_t register_max_attempts = 0; // 0: retry until stopped
  std::chrono::milliseconds master_timeout{5000};

  std::string tools_config;
  std::string log_file;
  std::string log_level = "info";

  void load_from_env();

  /**
   * @throws std::invalid_argument if the heartbeat interval or master timeout is not positive.
   */
  void validate() const;
  void print_config() const;
  nlohmann::json to_json() const;
};

} // namespace tfc
