/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "coordinator/health_monitor.hpp"

#include "common/errors.hpp"

namespace tfc {

HealthMonitor::HealthMonitor(WorkerRegistry &registry, WorkerTransport &transport,
                             const CoordinatorConfig &config, Logger &logger)
    : registry_(registry), transport_(transport), config_(config), logger_(logger),
      io_context_(), timer_(io_context_) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  io_context_.restart();
  schedule_next();
  thread_ = std::thread([this]() { io_context_.run(); });
  logger_.info("Worker health monitor started (interval {} ms, timeout {} ms)",
               config_.sweep_interval.count(), config_.heartbeat_timeout.count());
}

void HealthMonitor::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  asio::post(io_context_, [this]() { timer_.cancel(); });
  if (thread_.joinable()) {
    thread_.join();
  }
  logger_.info("Worker health monitor stopped");
}

void HealthMonitor::schedule_next() {
  timer_.expires_after(config_.sweep_interval);
  timer_.async_wait([this](const std::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }

    try {
      sweep_once();
    } catch (const std::exception &e) {
      logger_.error("Health sweep failed: {}", e.what());
    }

    if (running_.load(std::memory_order_acquire)) {
      schedule_next();
    }
  });
}

SweepReport HealthMonitor::sweep_once() {
  SweepReport report;
  report.evicted = registry_.evict_stale(config_.heartbeat_timeout);

  for (const auto &[worker_id, invalidated] : report.evicted) {
    report.offline.push_back(worker_id);
    logger_.warn("Worker {} missed its heartbeat deadline, evicted ({} instances invalidated)",
                 worker_id, invalidated.size());
    for (const auto &instance_id : invalidated) {
      logger_.info("  - dropped instance mapping: {}", instance_id);
    }
  }

  if (config_.instance_idle_timeout.count() > 0) {
    report.expired = registry_.expire_idle(config_.instance_idle_timeout);
    for (const auto &entry : report.expired) {
      const InstanceMapping &mapping = entry.mapping;
      logger_.info("Instance {} on worker {} idle for longer than {} ms, released",
                   mapping.instance_id, mapping.worker_id, config_.instance_idle_timeout.count());
      if (entry.base_url.empty() || mapping.tool_name.empty()) {
        continue;
      }
      try {
        transport_.post(entry.base_url, "/" + mapping.tool_name + "/release",
                        nlohmann::json{{"instance_id", mapping.instance_id}},
                        config_.timeout_for(mapping.tool_name));
      } catch (const CoordinatorError &e) {
        logger_.warn("Release of idle instance {} on worker {} failed: {}", mapping.instance_id,
                     mapping.worker_id, e.what());
      }
    }
  }

  sweeps_completed_.fetch_add(1, std::memory_order_acq_rel);
  return report;
}

}  // namespace tfc
