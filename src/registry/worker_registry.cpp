/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "registry/worker_registry.hpp"

#include "common/errors.hpp"
#include "common/ids.hpp"
#include "registry/load_balancer.hpp"

#include <algorithm>

namespace tfc {

WorkerRegistry::WorkerRegistry(TimeSource now) : now_(std::move(now)) {}

RegistrationOutcome WorkerRegistry::register_worker(const WorkerRegistration &registration) {
  if (registration.base_url.empty()) {
    throw ValidationError("base_url is required");
  }
  if (registration.supported_tools.empty()) {
    throw ValidationError("supported_tools must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  RegistrationOutcome outcome;
  outcome.worker_id = registration.worker_id;
  if (outcome.worker_id.empty()) {
    do {
      outcome.worker_id = generate_worker_id();
    } while (workers_.count(outcome.worker_id) > 0);
  }

  SteadyTime now = now_();
  WallTime wall_now = WallClock::now();

  WorkerRecord record;
  record.worker_id = outcome.worker_id;
  record.base_url = registration.base_url;
  record.supported_tools = registration.supported_tools;
  record.host_info = registration.host_info;
  record.last_heartbeat_at = now;
  record.last_heartbeat_wall = wall_now;
  record.registered_at = wall_now;
  record.status = WorkerStatus::ONLINE;

  auto it = workers_.find(outcome.worker_id);
  if (it != workers_.end()) {
    outcome.replaced = true;
    WorkerRecord &previous = it->second;
    unindex_worker_locked(previous);

    if (previous.base_url != registration.base_url) {
      outcome.invalidated_instances = drop_instances_locked(outcome.worker_id);
    } else {
      for (auto inst = instances_.begin(); inst != instances_.end();) {
        const InstanceMapping &mapping = inst->second;
        if (mapping.worker_id == outcome.worker_id && !mapping.tool_name.empty() &&
            registration.supported_tools.count(mapping.tool_name) == 0) {
          outcome.invalidated_instances.push_back(mapping.instance_id);
          inst = instances_.erase(inst);
        } else {
          ++inst;
        }
      }
      std::sort(outcome.invalidated_instances.begin(), outcome.invalidated_instances.end());
      record.registered_at = previous.registered_at;
    }
    record.active_instance_count = 0;
    for (const auto &[id, mapping] : instances_) {
      if (mapping.worker_id == outcome.worker_id) {
        ++record.active_instance_count;
      }
    }
    previous = std::move(record);
    index_worker_locked(previous);
  } else {
    auto inserted = workers_.emplace(outcome.worker_id, std::move(record));
    index_worker_locked(inserted.first->second);
  }

  for (const auto &tool : registration.supported_tools) {
    if (known_tools_.insert(tool).second) {
      outcome.new_tools.push_back(tool);
    }
  }
  return outcome;
}

void WorkerRegistry::heartbeat(const std::string &worker_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = workers_.find(worker_id);
  if (it == workers_.end() || it->second.status != WorkerStatus::ONLINE) {
    throw UnknownWorker(worker_id);
  }
  it->second.last_heartbeat_at = now_();
  it->second.last_heartbeat_wall = WallClock::now();
}

std::string WorkerRegistry::pick_worker(const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pick_worker_locked(tool_name);
}

std::string WorkerRegistry::pick_worker_locked(const std::string &tool_name) const {
  auto it = tool_index_.find(tool_name);
  if (it == tool_index_.end() || it->second.empty()) {
    throw NoWorkerAvailable(tool_name);
  }

  std::vector<WorkerLoad> candidates;
  candidates.reserve(it->second.size());
  for (const auto &worker_id : it->second) {
    const WorkerRecord &record = workers_.at(worker_id);
    candidates.push_back({record.worker_id, record.active_instance_count,
                          record.last_heartbeat_at});
  }

  auto selected = LoadBalancer::select(candidates);
  if (!selected) {
    throw NoWorkerAvailable(tool_name);
  }
  return *selected;
}

void WorkerRegistry::bind_instance(const std::string &instance_id, const std::string &worker_id,
                                   const std::string &tool_name, const nlohmann::json &identity) {
  if (instance_id.empty()) {
    throw ValidationError("instance_id is required");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto worker = workers_.find(worker_id);
  if (worker == workers_.end() || worker->second.status != WorkerStatus::ONLINE) {
    throw UnknownWorker(worker_id);
  }

  auto existing = instances_.find(instance_id);
  if (existing != instances_.end()) {
    if (existing->second.worker_id == worker_id) {
      return;
    }
    throw ValidationError("Instance " + instance_id + " is already bound to worker " +
                          existing->second.worker_id);
  }

  InstanceMapping mapping;
  mapping.instance_id = instance_id;
  mapping.worker_id = worker_id;
  mapping.tool_name = tool_name;
  mapping.state = BindingState::BOUND;
  mapping.identity = identity;
  mapping.token = next_token_++;
  mapping.last_used_at = now_();
  instances_.emplace(instance_id, std::move(mapping));
  ++worker->second.active_instance_count;
}

std::optional<std::string> WorkerRegistry::resolve_instance(const std::string &instance_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(instance_id);
  if (it == instances_.end() || it->second.state != BindingState::BOUND) {
    return std::nullopt;
  }
  return it->second.worker_id;
}

std::vector<std::string> WorkerRegistry::evict(const std::string &worker_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = workers_.find(worker_id);
  if (it == workers_.end()) {
    throw UnknownWorker(worker_id);
  }
  unindex_worker_locked(it->second);
  std::vector<std::string> invalidated = drop_instances_locked(worker_id);
  workers_.erase(it);
  return invalidated;
}

InstanceReservation WorkerRegistry::reserve_instance(const std::string &tool_name,
                                                     const std::string &instance_id,
                                                     const nlohmann::json &identity) {
  std::lock_guard<std::mutex> lock(mutex_);

  InstanceReservation reservation;
  reservation.tool_name = tool_name;

  if (!instance_id.empty()) {
    auto existing = instances_.find(instance_id);
    if (existing != instances_.end()) {
      const InstanceMapping &mapping = existing->second;
      if (mapping.state == BindingState::PENDING) {
        throw InstancePending(instance_id);
      }
      if (!mapping.tool_name.empty() && mapping.tool_name != tool_name) {
        throw ValidationError("Instance " + instance_id + " is bound to tool " +
                              mapping.tool_name);
      }
      if (!worker_online_locked(mapping.worker_id)) {
        throw InstanceNotBound("Worker " + mapping.worker_id + " bound to instance " +
                               instance_id + " is not healthy");
      }
      const WorkerRecord &worker = workers_.at(mapping.worker_id);
      reservation.instance_id = instance_id;
      reservation.worker_id = mapping.worker_id;
      reservation.base_url = worker.base_url;
      reservation.token = mapping.token;
      reservation.active_instance_count = worker.active_instance_count;
      reservation.existing = true;
      return reservation;
    }
    reservation.instance_id = instance_id;
  } else {
    do {
      reservation.instance_id = generate_instance_id();
    } while (instances_.count(reservation.instance_id) > 0);
  }

  std::string worker_id = pick_worker_locked(tool_name);
  WorkerRecord &worker = workers_.at(worker_id);

  InstanceMapping mapping;
  mapping.instance_id = reservation.instance_id;
  mapping.worker_id = worker_id;
  mapping.tool_name = tool_name;
  mapping.state = BindingState::PENDING;
  mapping.identity = identity;
  mapping.token = next_token_++;
  mapping.last_used_at = now_();

  reservation.worker_id = worker_id;
  reservation.base_url = worker.base_url;
  reservation.token = mapping.token;

  instances_.emplace(reservation.instance_id, std::move(mapping));
  ++worker.active_instance_count;
  reservation.active_instance_count = worker.active_instance_count;
  return reservation;
}

void WorkerRegistry::commit_instance(const InstanceReservation &reservation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(reservation.instance_id);
  if (it == instances_.end() || it->second.token != reservation.token) {
    throw InstanceNotBound("Instance " + reservation.instance_id + " was invalidated while " +
                           "being created on worker " + reservation.worker_id);
  }
  it->second.state = BindingState::BOUND;
  it->second.last_used_at = now_();
}

void WorkerRegistry::cancel_instance(const InstanceReservation &reservation) {
  if (reservation.existing) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(reservation.instance_id);
  if (it == instances_.end() || it->second.token != reservation.token) {
    return;
  }
  std::string worker_id = it->second.worker_id;
  instances_.erase(it);
  release_slot_locked(worker_id);
}

RouteTarget WorkerRegistry::route_instance(const std::string &instance_id,
                                           const std::string &tool_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(instance_id);
  if (it == instances_.end()) {
    throw InstanceNotBound("No worker found for instance_id: " + instance_id);
  }
  InstanceMapping &mapping = it->second;
  if (mapping.state == BindingState::PENDING) {
    throw InstancePending(instance_id);
  }
  if (!tool_name.empty() && !mapping.tool_name.empty() && mapping.tool_name != tool_name) {
    throw InstanceNotBound("Instance " + instance_id + " is not bound for tool " + tool_name);
  }

  auto worker = workers_.find(mapping.worker_id);
  if (worker == workers_.end() || worker->second.status != WorkerStatus::ONLINE) {
    throw InstanceNotBound("Worker " + mapping.worker_id + " bound to instance " + instance_id +
                           " is not healthy");
  }

  mapping.last_used_at = now_();
  return RouteTarget{instance_id, mapping.worker_id, worker->second.base_url,
                     worker->second.active_instance_count};
}

std::optional<InstanceMapping> WorkerRegistry::release_instance(const std::string &instance_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(instance_id);
  if (it == instances_.end()) {
    return std::nullopt;
  }
  InstanceMapping mapping = std::move(it->second);
  instances_.erase(it);
  release_slot_locked(mapping.worker_id);
  return mapping;
}

std::vector<std::string> WorkerRegistry::mark_stale(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  return mark_stale_locked(timeout);
}

std::map<std::string, std::vector<std::string>>
WorkerRegistry::evict_stale(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::vector<std::string>> evicted;
  for (const auto &worker_id : mark_stale_locked(timeout)) {
    evicted.emplace(worker_id, drop_instances_locked(worker_id));
    workers_.erase(worker_id);
  }
  return evicted;
}

std::vector<std::string> WorkerRegistry::mark_stale_locked(std::chrono::milliseconds timeout) {
  SteadyTime now = now_();
  std::vector<std::string> stale;
  for (auto &[worker_id, record] : workers_) {
    if (record.status == WorkerStatus::ONLINE && now - record.last_heartbeat_at > timeout) {
      record.status = WorkerStatus::OFFLINE;
      unindex_worker_locked(record);
      stale.push_back(worker_id);
    }
  }
  std::sort(stale.begin(), stale.end());
  return stale;
}

bool WorkerRegistry::release_orphaned_instance(const std::string &instance_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(instance_id);
  if (it == instances_.end() || worker_online_locked(it->second.worker_id)) {
    return false;
  }
  std::string worker_id = it->second.worker_id;
  instances_.erase(it);
  release_slot_locked(worker_id);
  return true;
}

std::vector<ExpiredInstance> WorkerRegistry::expire_idle(std::chrono::milliseconds idle_timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  SteadyTime now = now_();
  std::vector<ExpiredInstance> expired;
  for (auto it = instances_.begin(); it != instances_.end();) {
    const InstanceMapping &mapping = it->second;
    if (mapping.state == BindingState::BOUND && now - mapping.last_used_at > idle_timeout) {
      ExpiredInstance entry;
      entry.mapping = mapping;
      auto worker = workers_.find(mapping.worker_id);
      if (worker != workers_.end()) {
        entry.base_url = worker->second.base_url;
      }
      std::string worker_id = mapping.worker_id;
      it = instances_.erase(it);
      release_slot_locked(worker_id);
      expired.push_back(std::move(entry));
    } else {
      ++it;
    }
  }
  return expired;
}

void WorkerRegistry::declare_tools(const std::vector<std::string> &tool_names) {
  std::lock_guard<std::mutex> lock(mutex_);
  known_tools_.insert(tool_names.begin(), tool_names.end());
}

std::optional<WorkerRecord> WorkerRegistry::find_worker(const std::string &worker_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = workers_.find(worker_id);
  if (it == workers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t WorkerRegistry::worker_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}

size_t WorkerRegistry::instance_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return instances_.size();
}

RegistrySnapshot WorkerRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RegistrySnapshot snap;
  snap.taken_at = now_();
  snap.taken_wall = WallClock::now();
  snap.known_tools = known_tools_;

  snap.workers.reserve(workers_.size());
  for (const auto &[id, record] : workers_) {
    snap.workers.push_back(record);
  }
  std::sort(snap.workers.begin(), snap.workers.end(),
            [](const WorkerRecord &a, const WorkerRecord &b) { return a.worker_id < b.worker_id; });

  for (const auto &[tool, ids] : tool_index_) {
    snap.tool_index.emplace(tool, ids);
  }

  snap.instances.reserve(instances_.size());
  for (const auto &[id, mapping] : instances_) {
    snap.instances.push_back(mapping);
  }
  std::sort(snap.instances.begin(), snap.instances.end(),
            [](const InstanceMapping &a, const InstanceMapping &b) {
              return a.instance_id < b.instance_id;
            });
  return snap;
}

void WorkerRegistry::index_worker_locked(const WorkerRecord &record) {
  if (record.status != WorkerStatus::ONLINE) {
    return;
  }
  for (const auto &tool : record.supported_tools) {
    tool_index_[tool].insert(record.worker_id);
  }
}

void WorkerRegistry::unindex_worker_locked(const WorkerRecord &record) {
  for (const auto &tool : record.supported_tools) {
    auto it = tool_index_.find(tool);
    if (it == tool_index_.end()) {
      continue;
    }
    it->second.erase(record.worker_id);
    if (it->second.empty()) {
      tool_index_.erase(it);
    }
  }
}

std::vector<std::string> WorkerRegistry::drop_instances_locked(const std::string &worker_id) {
  std::vector<std::string> dropped;
  for (auto it = instances_.begin(); it != instances_.end();) {
    if (it->second.worker_id == worker_id) {
      dropped.push_back(it->first);
      it = instances_.erase(it);
    } else {
      ++it;
    }
  }
  auto worker = workers_.find(worker_id);
  if (worker != workers_.end()) {
    worker->second.active_instance_count = 0;
  }
  std::sort(dropped.begin(), dropped.end());
  return dropped;
}

bool WorkerRegistry::worker_online_locked(const std::string &worker_id) const {
  auto worker = workers_.find(worker_id);
  return worker != workers_.end() && worker->second.status == WorkerStatus::ONLINE;
}

void WorkerRegistry::release_slot_locked(const std::string &worker_id) {
  auto worker = workers_.find(worker_id);
  if (worker != workers_.end() && worker->second.active_instance_count > 0) {
    --worker->second.active_instance_count;
  }
}

size_t RegistrySnapshot::online_workers() const {
  return static_cast<size_t>(
      std::count_if(workers.begin(), workers.end(), [](const WorkerRecord &record) {
        return record.status == WorkerStatus::ONLINE;
      }));
}

size_t RegistrySnapshot::live_workers_for(const std::string &tool_name) const {
  auto it = tool_index.find(tool_name);
  return it == tool_index.end() ? 0 : it->second.size();
}

nlohmann::json RegistrySnapshot::to_json() const {
  nlohmann::json workers_json = nlohmann::json::object();
  for (const auto &record : workers) {
    double since = std::chrono::duration<double>(taken_at - record.last_heartbeat_at).count();
    workers_json[record.worker_id] = {
        {"url", record.base_url},
        {"tools", record.supported_tools},
        {"active_instance_count", record.active_instance_count},
        {"status", to_string(record.status)},
        {"last_heartbeat", format_wall_time(record.last_heartbeat_wall)},
        {"seconds_since_heartbeat", std::max(0.0, since)},
        {"registered_at", format_wall_time(record.registered_at)},
        {"host_info", record.host_info.to_json()}};
  }

  nlohmann::json tools_json = nlohmann::json::object();
  for (const auto &tool : known_tools) {
    auto it = tool_index.find(tool);
    tools_json[tool] = it == tool_index.end() ? nlohmann::json::array() : nlohmann::json(it->second);
  }
  for (const auto &[tool, ids] : tool_index) {
    if (!tools_json.contains(tool)) {
      tools_json[tool] = ids;
    }
  }

  nlohmann::json instances_json = nlohmann::json::object();
  for (const auto &mapping : instances) {
    instances_json[mapping.instance_id] = {{"worker_id", mapping.worker_id},
                                           {"tool", mapping.tool_name},
                                           {"state", to_string(mapping.state)}};
  }

  return nlohmann::json{{"status", "ok"},
                        {"registered_workers", workers.size()},
                        {"online_workers", online_workers()},
                        {"workers", workers_json},
                        {"tools", tools_json},
                        {"instances", instances_json},
                        {"instance_mappings", instances.size()}};
}

}  // namespace tfc
