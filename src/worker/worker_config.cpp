/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "worker/worker_config.hpp"

#include "utils/env.hpp"

#include <iostream>
#include <stdexcept>

using namespace std;

namespace tfc {

void WorkerConfig::load_from_env() {
  host = Env::get<string>("TFC_WORKER_HOST", host);
  port = Env::get<int>("TFC_WORKER_PORT", port);
  http_threads = Env::get<size_t>("TFC_WORKER_HTTP_THREADS", http_threads);
  worker_id = Env::get<string>("TFC_WORKER_ID", worker_id);
  advertise_url = Env::get<string>("TFC_WORKER_ADVERTISE_URL", advertise_url);
  master_url = Env::get<string>("TFC_MASTER_URL", master_url);
  heartbeat_interval = Env::get_seconds("TFC_HEARTBEAT_INTERVAL", heartbeat_interval);
  register_initial_backoff =
      Env::get_seconds("TFC_REGISTER_INITIAL_BACKOFF", register_initial_backoff);
  register_max_backoff = Env::get_seconds("TFC_REGISTER_MAX_BACKOFF", register_max_backoff);
  register_max_attempts = Env::get<size_t>("TFC_REGISTER_MAX_ATTEMPTS", register_max_attempts);
  master_timeout = Env::get_seconds("TFC_MASTER_TIMEOUT", master_timeout);
  tools_config = Env::get<string>("TFC_TOOLS_CONFIG", tools_config);
  log_file = Env::get<string>("TFC_LOG_FILE", log_file);
  log_level = Env::get<string>("TFC_LOG_LEVEL", log_level);
  validate();
}

void WorkerConfig::validate() const {
  if (heartbeat_interval.count() <= 0) {
    throw invalid_argument("Heartbeat interval must be positive");
  }
  if (master_timeout.count() <= 0) {
    throw invalid_argument("Master timeout must be positive");
  }
}

void WorkerConfig::print_config() const {
  cout << "Worker Configuration:" << endl;
  cout << "  Listen: " << host << ":" << port << endl;
  cout << "  HTTP Threads: " << http_threads << endl;
  cout << "  Worker ID: " << (worker_id.empty() ? "<assigned by master>" : worker_id) << endl;
  cout << "  Advertise URL: " << (advertise_url.empty() ? "<auto>" : advertise_url) << endl;
  cout << "  Master URL: " << master_url << endl;
  cout << "  Heartbeat Interval (ms): " << heartbeat_interval.count() << endl;
  cout << "  Register Backoff (ms): " << register_initial_backoff.count() << " .. "
       << register_max_backoff.count() << endl;
  cout << "  Register Max Attempts: "
       << (register_max_attempts == 0 ? string("unlimited") : to_string(register_max_attempts))
       << endl;
  cout << "  Tools Config: " << (tools_config.empty() ? "<builtin>" : tools_config) << endl;
  cout << "  Log File: " << (log_file.empty() ? "<console>" : log_file) << endl;
  cout << "  Log Level: " << log_level << endl;
}

nlohmann::json WorkerConfig::to_json() const {
  return nlohmann::json{{"host", host},
                        {"port", port},
                        {"worker_id", worker_id},
                        {"advertise_url", advertise_url},
                        {"master_url", master_url},
                        {"heartbeat_interval_ms", heartbeat_interval.count()},
                        {"register_initial_backoff_ms", register_initial_backoff.count()},
                        {"register_max_backoff_ms", register_max_backoff.count()},
                        {"register_max_attempts", register_max_attempts},
                        {"tools_config", tools_config}};
}

} // namespace tfc
