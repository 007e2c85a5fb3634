/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "registry/worker_record.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace tfc {

/**
 * Master could not be reached or refused the request. Always retried by the agent.
 */
class MasterUnavailable : public std::runtime_error {
public:
  explicit MasterUnavailable(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Worker-to-master calls.
 */
class MasterLink {
public:
  virtual ~MasterLink() = default;

  /**
   * @return The worker id the master assigned or confirmed.
   * @throws MasterUnavailable
   */
  virtual std::string register_worker(const WorkerRegistration &registration) = 0;

  /**
   * @throws UnknownWorker when the master no longer knows the id, MasterUnavailable otherwise.
   */
  virtual void heartbeat(const std::string &worker_id) = 0;
};

class HttpMasterLink : public MasterLink {
public:
  HttpMasterLink(std::string master_url, std::chrono::milliseconds timeout);

  std::string register_worker(const WorkerRegistration &registration) override;
  void heartbeat(const std::string &worker_id) override;

  const std::string &master_url() const { return master_url_; }

private:
  std::string master_url_;
  std::chrono::milliseconds timeout_;
};

} // namespace tfc
