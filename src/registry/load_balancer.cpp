/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "registry/load_balancer.hpp"

#include <algorithm>

namespace tfc {

bool LoadBalancer::less_loaded(const WorkerLoad &a, const WorkerLoad &b) {
  if (a.active_instance_count != b.active_instance_count) {
    return a.active_instance_count < b.active_instance_count;
  }
  if (a.last_heartbeat_at != b.last_heartbeat_at) {
    return a.last_heartbeat_at < b.last_heartbeat_at;
  }
  return a.worker_id < b.worker_id;
}

std::optional<std::string> LoadBalancer::select(const std::vector<WorkerLoad> &candidates) {
  if (candidates.empty()) {
    return std::nullopt;
  }
  auto it = std::min_element(candidates.begin(), candidates.end(), less_loaded);
  return it->worker_id;
}

}  // namespace tfc
