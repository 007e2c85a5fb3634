/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "coordinator.hpp"

#include <functional>
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

namespace tfc {

/**
 * @brief HTTP surface of the coordinator.
 *
 * Routes:
 *   GET    /                                   dashboard
 *   GET    /health                             registry snapshot
 *   POST   /register                           worker registration
 *   PUT    /heartbeat/{worker_id}              liveness
 *   DELETE /workers/{worker_id}                explicit unregister
 *   POST   /tools/{tool}/create|execute|release|calc_reward
 *
 * Every CoordinatorError becomes a structured failure with its mapped status.
 */
class MasterHttpServer {
public:
  MasterHttpServer(Coordinator &coordinator, std::string host, int port, size_t threads);
  ~MasterHttpServer();

  MasterHttpServer(const MasterHttpServer &) = delete;
  MasterHttpServer &operator=(const MasterHttpServer &) = delete;

  /**
   * @brief Binds and serves on a background thread. Port 0 binds an ephemeral port.
   * @throws std::runtime_error if the address cannot be bound.
   */
  void start();

  void stop();

  int port() const { return bound_port_; }
  bool is_running() const { return server_.is_running(); }

private:
  using Handler = std::function<void(const httplib::Request &, httplib::Response &)>;

  void register_routes();
  Handler guarded(Handler handler);

  Coordinator &coordinator_;
  std::string host_;
  int port_;
  int bound_port_ = -1;
  size_t threads_;
  httplib::Server server_;
  std::thread thread_;
};

} // namespace tfc
