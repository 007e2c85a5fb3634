/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace tfc {

/**
 * @brief Abstract channel from the coordinator to a worker's execution endpoint.
 *
 * Implementations throw WorkerTimeout when the deadline passes, WorkerUnreachable when the
 * worker cannot be contacted and WorkerError when it answers with a non-2xx status.
 */
class WorkerTransport {
public:
  virtual ~WorkerTransport() = default;

  /**
   * @brief POSTs body as JSON to base_url + path and returns the decoded reply.
   */
  virtual nlohmann::json post(const std::string &base_url, const std::string &path,
                              const nlohmann::json &body, std::chrono::milliseconds timeout) = 0;

  /**
   * @brief GETs base_url + "/health". Returns false instead of throwing.
   */
  virtual bool check_health(const std::string &base_url,
                            std::chrono::milliseconds timeout) = 0;
};

}  // namespace tfc
