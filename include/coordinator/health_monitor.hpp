/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "coordinator_config.hpp"
#include "logging/logger.hpp"
#include "registry/worker_registry.hpp"
#include "worker_transport.hpp"

#include <asio.hpp>
#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace tfc {

struct SweepReport {
  std::vector<std::string> offline;
  std::map<std::string, std::vector<std::string>> evicted; // worker id -> invalidated instances
  std::vector<ExpiredInstance> expired;
};

/**
 * @brief Periodic liveness sweep over the registry.
 *
 * Runs on its own io_context thread, independent of request handling. It talks to request
 * handlers only through the registry's atomic operations. stop() cancels the pending timer and
 * joins the thread; a sweep in progress finishes first.
 */
class HealthMonitor {
public:
  HealthMonitor(WorkerRegistry &registry, WorkerTransport &transport,
                const CoordinatorConfig &config, Logger &logger);

  ~HealthMonitor();

  HealthMonitor(const HealthMonitor &) = delete;
  HealthMonitor &operator=(const HealthMonitor &) = delete;

  void start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  /**
   * @brief One full pass: stale workers go OFFLINE, then are evicted together with their
   * bindings; idle bindings expire when idle expiry is enabled.
   */
  SweepReport sweep_once();

  size_t sweeps_completed() const { return sweeps_completed_.load(std::memory_order_acquire); }

private:
  void schedule_next();

  WorkerRegistry &registry_;
  WorkerTransport &transport_;
  const CoordinatorConfig &config_;
  Logger &logger_;

  asio::io_context io_context_;
  asio::steady_timer timer_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<size_t> sweeps_completed_{0};
};

}  // namespace tfc
