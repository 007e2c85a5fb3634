/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "coordinator_config.hpp"
#include "health_monitor.hpp"
#include "logging/logger.hpp"
#include "registry/worker_registry.hpp"
#include "worker_transport.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tfc {

struct CreateRequest {
  std::string instance_id; // empty: generated by the coordinator
  nlohmann::json identity = nlohmann::json::object();

  static CreateRequest from_json(const nlohmann::json &j);
};

/**
 * @brief Master side of the tool fleet.
 *
 * Owns the worker registry and the health monitor, and proxies tool calls to the worker an
 * instance is bound to. The registry lock is only held inside registry calls, never across
 * the outbound call to a worker, and each inbound request makes at most one outbound call.
 */
class Coordinator {
public:
  Coordinator(CoordinatorConfig config, std::unique_ptr<WorkerTransport> transport,
              WorkerRegistry::TimeSource now = [] { return SteadyClock::now(); });

  ~Coordinator();

  Coordinator(const Coordinator &) = delete;
  Coordinator &operator=(const Coordinator &) = delete;

  /**
   * @brief Starts the background liveness sweep.
   */
  void start();
  void stop();

  RegistrationOutcome register_worker(WorkerRegistration registration);

  void heartbeat(const std::string &worker_id);

  /**
   * @brief Explicit removal of a worker and all of its bindings.
   * @return Invalidated instance ids.
   */
  std::vector<std::string> unregister_worker(const std::string &worker_id);

  /**
   * @brief Creates (or returns the existing binding of) an instance of tool_name.
   *
   * A new instance is routed to the least loaded worker, created there, and only then
   * committed. On any failure the provisional binding is rolled back.
   */
  nlohmann::json create_instance(const std::string &tool_name, const CreateRequest &request);

  /**
   * @brief Forwards body verbatim to the worker bound to body.instance_id and returns its
   * reply unchanged. Never re-routes an unbound instance.
   */
  nlohmann::json execute(const std::string &tool_name, const nlohmann::json &body);

  nlohmann::json calc_reward(const std::string &tool_name, const nlohmann::json &body);

  /**
   * @brief Finalizes an instance. The binding is removed whatever the worker answers.
   */
  nlohmann::json release(const std::string &tool_name, const nlohmann::json &body);

  void declare_tools(const std::vector<std::string> &tool_names);

  RegistrySnapshot snapshot() const { return registry_.snapshot(); }
  nlohmann::json health() const;

  WorkerRegistry &registry() { return registry_; }
  HealthMonitor &health_monitor() { return health_monitor_; }
  const CoordinatorConfig &config() const { return config_; }
  Logger &logger() { return logger_; }

private:
  nlohmann::json forward_bound(const std::string &tool_name, const std::string &action,
                               const nlohmann::json &body);

  CoordinatorConfig config_;
  Logger logger_;
  std::unique_ptr<WorkerTransport> transport_;
  WorkerRegistry registry_;
  HealthMonitor health_monitor_;
};

}  // namespace tfc
