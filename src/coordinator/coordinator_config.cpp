/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "coordinator/coordinator_config.hpp"

#include "utils/env.hpp"

#include <iostream>
#include <stdexcept>

using namespace std;

namespace tfc {

chrono::milliseconds CoordinatorConfig::timeout_for(const string &tool_name) const {
  auto it = tool_timeouts.find(tool_name);
  return it != tool_timeouts.end() ? it->second : worker_call_timeout;
}

void CoordinatorConfig::load_from_env() {
  host = Env::get<string>("TFC_MASTER_HOST", host);
  port = Env::get<int>("TFC_MASTER_PORT", port);
  http_threads = Env::get<size_t>("TFC_HTTP_THREADS", http_threads);
  heartbeat_timeout = Env::get_seconds("TFC_HEARTBEAT_TIMEOUT", heartbeat_timeout);
  sweep_interval = Env::get_seconds("TFC_SWEEP_INTERVAL", sweep_interval);
  instance_idle_timeout = Env::get_seconds("TFC_INSTANCE_IDLE_TIMEOUT", instance_idle_timeout);
  worker_call_timeout = Env::get_seconds("TFC_TIMEOUT_PER_QUERY", worker_call_timeout);
  verify_worker_on_register = Env::get<bool>("TFC_VERIFY_WORKERS", verify_worker_on_register);
  health_check_timeout = Env::get_seconds("TFC_HEALTH_CHECK_TIMEOUT", health_check_timeout);
  tools_config = Env::get<string>("TFC_TOOLS_CONFIG", tools_config);
  log_file = Env::get<string>("TFC_LOG_FILE", log_file);
  log_level = Env::get<string>("TFC_LOG_LEVEL", log_level);
  validate();
}

void CoordinatorConfig::validate() const {
  if (heartbeat_timeout.count() <= 0) {
    throw invalid_argument("Heartbeat timeout must be positive");
  }
  if (sweep_interval.count() <= 0) {
    throw invalid_argument("Sweep interval must be positive");
  }
  if (instance_idle_timeout.count() < 0) {
    throw invalid_argument("Instance idle timeout must not be negative");
  }
}

void CoordinatorConfig::print_config() const {
  cout << "Coordinator Configuration:" << endl;
  cout << "  Listen: " << host << ":" << port << endl;
  cout << "  HTTP Threads: " << http_threads << endl;
  cout << "  Heartbeat Timeout (ms): " << heartbeat_timeout.count() << endl;
  cout << "  Sweep Interval (ms): " << sweep_interval.count() << endl;
  cout << "  Instance Idle Timeout (ms): "
       << (instance_idle_timeout.count() > 0 ? to_string(instance_idle_timeout.count())
                                             : string("disabled"))
       << endl;
  cout << "  Timeout Per Query (ms): " << worker_call_timeout.count() << endl;
  for (const auto &[tool, timeout] : tool_timeouts) {
    cout << "    " << tool << ": " << timeout.count() << endl;
  }
  cout << "  Verify Workers On Register: " << (verify_worker_on_register ? "Yes" : "No") << endl;
  cout << "  Tools Config: " << (tools_config.empty() ? "<dynamic discovery>" : tools_config)
       << endl;
  cout << "  Log File: " << (log_file.empty() ? "<console>" : log_file) << endl;
  cout << "  Log Level: " << log_level << endl;
}

nlohmann::json CoordinatorConfig::to_json() const {
  nlohmann::json timeouts = nlohmann::json::object();
  for (const auto &[tool, timeout] : tool_timeouts) {
    timeouts[tool] = timeout.count();
  }
  return nlohmann::json{{"host", host},
                        {"port", port},
                        {"http_threads", http_threads},
                        {"heartbeat_timeout_ms", heartbeat_timeout.count()},
                        {"sweep_interval_ms", sweep_interval.count()},
                        {"instance_idle_timeout_ms", instance_idle_timeout.count()},
                        {"worker_call_timeout_ms", worker_call_timeout.count()},
                        {"tool_timeouts_ms", timeouts},
                        {"verify_worker_on_register", verify_worker_on_register},
                        {"tools_config", tools_config}};
}

}  // namespace tfc
