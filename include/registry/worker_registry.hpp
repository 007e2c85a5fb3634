/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "worker_record.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfc {

struct RegistrationOutcome {
  std::string worker_id;
  bool replaced = false;
  std::vector<std::string> new_tools;
  // bindings dropped because the worker came back at another address
  std::vector<std::string> invalidated_instances;
};

/**
 * Result of the first half of a create. When existing is true the instance was already bound
 * and nothing was reserved.
 */
struct InstanceReservation {
  std::string instance_id;
  std::string worker_id;
  std::string base_url;
  std::string tool_name;
  uint64_t token = 0;
  size_t active_instance_count = 0;
  bool existing = false;
};

struct RouteTarget {
  std::string instance_id;
  std::string worker_id;
  std::string base_url;
  size_t active_instance_count = 0;
};

struct ExpiredInstance {
  InstanceMapping mapping;
  std::string base_url;
};

struct RegistrySnapshot {
  std::vector<WorkerRecord> workers;
  std::map<std::string, std::set<std::string>> tool_index;
  std::vector<InstanceMapping> instances;
  std::set<std::string> known_tools;
  SteadyTime taken_at;
  WallTime taken_wall;

  size_t online_workers() const;
  size_t live_workers_for(const std::string &tool_name) const;
  nlohmann::json to_json() const;
};

/**
 * @brief Thread-safe store of worker records, the tool index and the instance map.
 *
 * The three structures are guarded by one mutex so that every public method is observed as a
 * single atomic step. No method performs I/O. The tool index only ever lists ONLINE workers.
 */
class WorkerRegistry {
public:
  using TimeSource = std::function<SteadyTime()>;

  explicit WorkerRegistry(TimeSource now = [] { return SteadyClock::now(); });

  WorkerRegistry(const WorkerRegistry &) = delete;
  WorkerRegistry &operator=(const WorkerRegistry &) = delete;

  /**
   * @brief Inserts or replaces a worker record. Idempotent on worker_id.
   * @throws ValidationError if base_url or supported_tools is empty.
   */
  RegistrationOutcome register_worker(const WorkerRegistration &registration);

  /**
   * @throws UnknownWorker if the id is absent or already OFFLINE.
   */
  void heartbeat(const std::string &worker_id);

  /**
   * @brief Least loaded ONLINE worker advertising tool_name.
   * @throws NoWorkerAvailable
   */
  std::string pick_worker(const std::string &tool_name) const;

  /**
   * @brief Binds an instance directly to a worker.
   * @throws UnknownWorker if the worker is not ONLINE, ValidationError if the instance is
   * already bound to a different worker.
   */
  void bind_instance(const std::string &instance_id, const std::string &worker_id,
                     const std::string &tool_name = "",
                     const nlohmann::json &identity = nlohmann::json::object());

  std::optional<std::string> resolve_instance(const std::string &instance_id) const;

  /**
   * @brief Removes the worker and every mapping pointing at it.
   * @return The invalidated instance ids, sorted.
   * @throws UnknownWorker
   */
  std::vector<std::string> evict(const std::string &worker_id);

  /**
   * @brief Picks a worker and records a PENDING binding in one step.
   *
   * An already BOUND instance of the same tool is returned with existing set and no count
   * change. An empty instance_id is replaced by a generated one.
   * @throws InstancePending, ValidationError, NoWorkerAvailable
   */
  InstanceReservation reserve_instance(const std::string &tool_name,
                                       const std::string &instance_id,
                                       const nlohmann::json &identity = nlohmann::json::object());

  /**
   * @throws InstanceNotBound if the reservation was invalidated in the meantime.
   */
  void commit_instance(const InstanceReservation &reservation);

  void cancel_instance(const InstanceReservation &reservation);

  /**
   * @brief Resolves an instance for an execute-like call and refreshes its idle timer.
   * @throws InstanceNotBound, InstancePending
   */
  RouteTarget route_instance(const std::string &instance_id, const std::string &tool_name);

  std::optional<InstanceMapping> release_instance(const std::string &instance_id);

  /**
   * @brief Drops a binding whose worker is gone or not ONLINE. Bindings to a healthy worker
   * are left alone.
   * @return Whether a binding was dropped.
   */
  bool release_orphaned_instance(const std::string &instance_id);

  /**
   * @brief Moves ONLINE workers silent for longer than timeout to OFFLINE.
   * @return Ids of the workers that changed state.
   */
  std::vector<std::string> mark_stale(std::chrono::milliseconds timeout);

  /**
   * @brief Marks stale workers OFFLINE and evicts them under one lock, so a worker that
   * re-registers concurrently is either evicted before it registers or not at all.
   * @return Worker id -> invalidated instance ids.
   */
  std::map<std::string, std::vector<std::string>> evict_stale(std::chrono::milliseconds timeout);

  std::vector<ExpiredInstance> expire_idle(std::chrono::milliseconds idle_timeout);

  void declare_tools(const std::vector<std::string> &tool_names);

  std::optional<WorkerRecord> find_worker(const std::string &worker_id) const;

  size_t worker_count() const;
  size_t instance_count() const;

  RegistrySnapshot snapshot() const;

private:
  void index_worker_locked(const WorkerRecord &record);
  void unindex_worker_locked(const WorkerRecord &record);
  std::vector<std::string> drop_instances_locked(const std::string &worker_id);
  std::vector<std::string> mark_stale_locked(std::chrono::milliseconds timeout);
  bool worker_online_locked(const std::string &worker_id) const;
  void release_slot_locked(const std::string &worker_id);
  std::string pick_worker_locked(const std::string &tool_name) const;

  TimeSource now_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, WorkerRecord> workers_;
  std::unordered_map<std::string, std::set<std::string>> tool_index_;
  std::unordered_map<std::string, InstanceMapping> instances_;
  std::set<std::string> known_tools_;
  uint64_t next_token_ = 1;
};

}  // namespace tfc
