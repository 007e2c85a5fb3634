/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "coordinator/http_server.hpp"

#include "common/errors.hpp"
#include "coordinator/dashboard.hpp"
#include "utils/http_json.hpp"

#include <stdexcept>

namespace tfc {

MasterHttpServer::MasterHttpServer(Coordinator &coordinator, std::string host, int port,
                                   size_t threads)
    : coordinator_(coordinator), host_(std::move(host)), port_(port),
      threads_(threads == 0 ? 1 : threads) {
  server_.new_task_queue = [this] { return new httplib::ThreadPool(threads_); };
  register_routes();
}

MasterHttpServer::~MasterHttpServer() { stop(); }

MasterHttpServer::Handler MasterHttpServer::guarded(Handler handler) {
  return [this, handler = std::move(handler)](const httplib::Request &req,
                                              httplib::Response &res) {
    try {
      handler(req, res);
    } catch (const CoordinatorError &e) {
      coordinator_.logger().debug("{} {} failed: [{}] {}", req.method, req.path,
                                  error_code_name(e.code()), e.what());
      send_json(res, e.http_status(), e.to_json());
    } catch (const nlohmann::json::exception &e) {
      send_json(res, 400, ValidationError(e.what()).to_json());
    } catch (const std::exception &e) {
      coordinator_.logger().error("{} {} raised an internal error: {}", req.method, req.path,
                                  e.what());
      send_json(res, 500,
                nlohmann::json{{"success", false},
                               {"error", e.what()},
                               {"code", error_code_name(ErrorCode::INTERNAL_ERROR)},
                               {"retryable", false}});
    }
  };
}

void MasterHttpServer::register_routes() {
  server_.Get("/", guarded([this](const httplib::Request &, httplib::Response &res) {
                res.set_content(render_dashboard(coordinator_.snapshot(), host_, bound_port_),
                                "text/html; charset=utf-8");
              }));

  server_.Get("/health", guarded([this](const httplib::Request &, httplib::Response &res) {
                send_json(res, 200, coordinator_.health());
              }));

  server_.Post("/register", guarded([this](const httplib::Request &req, httplib::Response &res) {
                 WorkerRegistration registration =
                     WorkerRegistration::from_json(parse_json_body(req));
                 RegistrationOutcome outcome = coordinator_.register_worker(registration);
                 send_json(res, 200,
                           nlohmann::json{{"success", true},
                                          {"worker_id", outcome.worker_id},
                                          {"message", "Worker registered"},
                                          {"new_tools", outcome.new_tools},
                                          {"invalidated_instances",
                                           outcome.invalidated_instances}});
               }));

  server_.Put(R"(/heartbeat/([^/]+))",
              guarded([this](const httplib::Request &req, httplib::Response &res) {
                std::string worker_id = req.matches[1];
                coordinator_.heartbeat(worker_id);
                send_json(res, 200, nlohmann::json{{"success", true}, {"worker_id", worker_id}});
              }));

  server_.Delete(R"(/workers/([^/]+))",
                 guarded([this](const httplib::Request &req, httplib::Response &res) {
                   std::string worker_id = req.matches[1];
                   std::vector<std::string> invalidated =
                       coordinator_.unregister_worker(worker_id);
                   send_json(res, 200,
                             nlohmann::json{{"success", true},
                                            {"worker_id", worker_id},
                                            {"invalidated_instances", invalidated}});
                 }));

  server_.Post(R"(/tools/([^/]+)/(create|execute|release|calc_reward))",
               guarded([this](const httplib::Request &req, httplib::Response &res) {
                 std::string tool_name = req.matches[1];
                 std::string action = req.matches[2];
                 nlohmann::json body = parse_json_body(req);

                 if (action == "create") {
                   send_json(res, 200,
                             coordinator_.create_instance(tool_name,
                                                          CreateRequest::from_json(body)));
                 } else if (action == "execute") {
                   send_json(res, 200, coordinator_.execute(tool_name, body));
                 } else if (action == "release") {
                   send_json(res, 200, coordinator_.release(tool_name, body));
                 } else {
                   send_json(res, 200, coordinator_.calc_reward(tool_name, body));
                 }
               }));
}

void MasterHttpServer::start() {
  if (port_ == 0) {
    bound_port_ = server_.bind_to_any_port(host_);
  } else {
    bound_port_ = server_.bind_to_port(host_, port_) ? port_ : -1;
  }
  if (bound_port_ < 0) {
    throw std::runtime_error("Failed to bind master server to " + host_ + ":" +
                             std::to_string(port_));
  }
  thread_ = std::thread([this]() { server_.listen_after_bind(); });
  server_.wait_until_ready();
  coordinator_.logger().info("Master server listening on http://{}:{}", host_, bound_port_);
}

void MasterHttpServer::stop() {
  if (server_.is_running()) {
    server_.stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

} // namespace tfc
