/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "worker_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tfc {

struct WorkerLoad {
  std::string worker_id;
  size_t active_instance_count = 0;
  SteadyTime last_heartbeat_at;
};

/**
 * @brief Least-active-instance-count selection.
 *
 * Ties go to the worker with the earliest last heartbeat, then to the smallest worker id so
 * that the choice is deterministic. The ranking is computed from the candidates passed in on
 * every call and never cached.
 */
class LoadBalancer {
public:
  static std::optional<std::string> select(const std::vector<WorkerLoad> &candidates);

  static bool less_loaded(const WorkerLoad &a, const WorkerLoad &b);
};

}  // namespace tfc
