/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "registry/worker_record.hpp"

#include "common/errors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace tfc {

static std::string optional_string(const nlohmann::json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null()) {
    return "";
  }
  if (!j[key].is_string()) {
    throw ValidationError(std::string("Field '") + key + "' must be a string");
  }
  return j[key].get<std::string>();
}

WorkerRegistration WorkerRegistration::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ValidationError("Registration body must be a JSON object");
  }

  WorkerRegistration reg;
  reg.worker_id = optional_string(j, "worker_id");
  reg.base_url = optional_string(j, "base_url");
  if (reg.base_url.empty()) {
    // field name used by older workers
    reg.base_url = optional_string(j, "worker_url");
  }

  const char *tools_key = j.contains("supported_tools") ? "supported_tools" : "tools";
  if (j.contains(tools_key) && !j[tools_key].is_null()) {
    if (!j[tools_key].is_array()) {
      throw ValidationError(std::string("Field '") + tools_key + "' must be an array");
    }
    for (const auto &tool : j[tools_key]) {
      if (!tool.is_string()) {
        throw ValidationError("Tool names must be strings");
      }
      reg.supported_tools.insert(tool.get<std::string>());
    }
  }

  if (j.contains("host_info")) {
    reg.host_info = HostInfo::from_json(j["host_info"]);
  }
  return reg;
}

std::string format_wall_time(WallTime time) {
  std::time_t t = WallClock::to_time_t(time);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

}  // namespace tfc
