/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "worker_transport.hpp"

namespace tfc {

/**
 * @brief WorkerTransport over HTTP/1.1. A fresh client per call, so concurrent proxied
 * requests never share a connection.
 */
class HttpWorkerTransport : public WorkerTransport {
public:
  HttpWorkerTransport() = default;
  ~HttpWorkerTransport() override = default;

  nlohmann::json post(const std::string &base_url, const std::string &path,
                      const nlohmann::json &body, std::chrono::milliseconds timeout) override;

  bool check_health(const std::string &base_url, std::chrono::milliseconds timeout) override;
};

}  // namespace tfc
