/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "logging/logger.hpp"
#include "master_link.hpp"
#include "tool.hpp"
#include "worker_config.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <httplib.h>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace tfc {

class UnknownTool : public std::runtime_error {
public:
  explicit UnknownTool(const std::string &tool_name)
      : std::runtime_error("Tool not hosted by this worker: " + tool_name) {}
};

/**
 * @brief Delay before registration attempt number attempt + 1.
 *
 * min(initial * 2^attempt + jitter, max_delay).
 */
std::chrono::milliseconds registration_backoff(size_t attempt, std::chrono::milliseconds initial,
                                               std::chrono::milliseconds max_delay,
                                               std::chrono::milliseconds jitter);

/**
 * @brief Hosts tools, serves them over HTTP and keeps the worker registered with the master.
 *
 * Registration and heartbeat run as timers on the agent's own io_context thread. A heartbeat
 * answered with UnknownWorker (the master evicted or restarted) sends the agent back into the
 * registration loop; any other heartbeat failure is retried on the next tick.
 */
class WorkerAgent {
public:
  WorkerAgent(WorkerConfig config, std::vector<std::unique_ptr<Tool>> tools,
              std::unique_ptr<MasterLink> master);
  ~WorkerAgent();

  WorkerAgent(const WorkerAgent &) = delete;
  WorkerAgent &operator=(const WorkerAgent &) = delete;

  /**
   * @brief Binds the HTTP server, then starts serving and registering in the background.
   * @throws std::runtime_error if the port cannot be bound.
   */
  void start();

  /**
   * @brief Cancels the timers, stops the HTTP server and joins both threads.
   */
  void stop();

  // Tool endpoints. Throw ValidationError, UnknownTool or UnknownInstance.
  nlohmann::json handle_create(const std::string &tool_name, const nlohmann::json &body);
  nlohmann::json handle_execute(const std::string &tool_name, const nlohmann::json &body);
  nlohmann::json handle_release(const std::string &tool_name, const nlohmann::json &body);
  nlohmann::json handle_calc_reward(const std::string &tool_name, const nlohmann::json &body);
  nlohmann::json health() const;

  /**
   * @brief One registration attempt. Adopts the id the master returns.
   * @return true on success.
   */
  bool register_once();

  /**
   * @brief One heartbeat. Returns false when the master asked the worker to re-register.
   */
  bool heartbeat_once();

  WorkerRegistration make_registration() const;

  std::vector<std::string> tool_names() const;
  std::string worker_id() const;
  std::string base_url() const;
  int port() const { return bound_port_; }
  bool is_registered() const { return registered_.load(std::memory_order_acquire); }
  size_t registration_attempts() const {
    return registration_attempts_.load(std::memory_order_acquire);
  }

  Logger &logger() { return logger_; }

private:
  Tool &find_tool(const std::string &tool_name) const;
  void register_routes();
  void schedule_registration(size_t attempt, std::chrono::milliseconds delay);
  void schedule_heartbeat();
  std::chrono::milliseconds next_backoff(size_t attempt);

  WorkerConfig config_;
  Logger logger_;
  std::map<std::string, std::unique_ptr<Tool>> tools_;
  std::unique_ptr<MasterLink> master_;

  mutable std::mutex identity_mutex_;
  std::string worker_id_;
  std::string base_url_;

  httplib::Server server_;
  std::thread server_thread_;
  int bound_port_ = -1;

  asio::io_context io_context_;
  asio::steady_timer timer_;
  std::thread io_thread_;
  std::mt19937 rng_;

  std::atomic<bool> running_{false};
  std::atomic<bool> registered_{false};
  std::atomic<size_t> registration_attempts_{0};
};

} // namespace tfc
