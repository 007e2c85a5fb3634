/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <set>
#include <string>

namespace tfc {

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

enum class WorkerStatus { ONLINE, OFFLINE };

inline const char *to_string(WorkerStatus status) {
  return status == WorkerStatus::ONLINE ? "ONLINE" : "OFFLINE";
}

/**
 * Descriptive metadata about the machine a worker runs on. Never used for routing.
 */
struct HostInfo {
  std::string hostname;
  std::string ip;
  int port = 0;

  nlohmann::json to_json() const {
    return nlohmann::json{{"hostname", hostname}, {"ip", ip}, {"port", port}};
  }

  static HostInfo from_json(const nlohmann::json &j) {
    HostInfo info;
    if (!j.is_object()) {
      return info;
    }
    info.hostname = j.value("hostname", "");
    info.ip = j.value("ip", "");
    if (j.contains("port") && j["port"].is_number_integer()) {
      info.port = j["port"].get<int>();
    }
    return info;
  }
};

/**
 * What a worker sends when it registers. worker_id may be empty, in which case the
 * registry generates one.
 */
struct WorkerRegistration {
  std::string worker_id;
  std::string base_url;
  std::set<std::string> supported_tools;
  HostInfo host_info;

  nlohmann::json to_json() const {
    nlohmann::json j{{"base_url", base_url},
                     {"supported_tools", supported_tools},
                     {"host_info", host_info.to_json()}};
    if (!worker_id.empty()) {
      j["worker_id"] = worker_id;
    }
    return j;
  }

  static WorkerRegistration from_json(const nlohmann::json &j);
};

struct WorkerRecord {
  std::string worker_id;
  std::string base_url;
  std::set<std::string> supported_tools;
  size_t active_instance_count = 0;
  SteadyTime last_heartbeat_at;
  WallTime last_heartbeat_wall;
  WallTime registered_at;
  WorkerStatus status = WorkerStatus::ONLINE;
  HostInfo host_info;
};

enum class BindingState { PENDING, BOUND };

inline const char *to_string(BindingState state) {
  return state == BindingState::PENDING ? "PENDING" : "BOUND";
}

/**
 * Binding of one session to one worker. worker_id never changes for the life of the
 * mapping; a PENDING mapping is a create that has been routed but not yet acknowledged.
 */
struct InstanceMapping {
  std::string instance_id;
  std::string worker_id;
  std::string tool_name;
  BindingState state = BindingState::PENDING;
  nlohmann::json identity;
  uint64_t token = 0;
  SteadyTime last_used_at;
};

std::string format_wall_time(WallTime time);

}  // namespace tfc
