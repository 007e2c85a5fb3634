/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "worker/worker_agent.hpp"

#include "common/errors.hpp"
#include "utils/host_info.hpp"
#include "utils/http_json.hpp"

#include <algorithm>
#include <stdexcept>

namespace tfc {

std::chrono::milliseconds registration_backoff(size_t attempt, std::chrono::milliseconds initial,
                                               std::chrono::milliseconds max_delay,
                                               std::chrono::milliseconds jitter) {
  // cap the shift; anything past 2^20 is far beyond max_delay anyway
  size_t shift = std::min<size_t>(attempt, 20);
  long long base = initial.count() * (1LL << shift);
  return std::min(std::chrono::milliseconds(base) + jitter, max_delay);
}

static std::string require_instance_id(const nlohmann::json &body) {
  if (!body.is_object() || !body.contains("instance_id") || !body["instance_id"].is_string()) {
    throw ValidationError("instance_id is required");
  }
  return body["instance_id"].get<std::string>();
}

WorkerAgent::WorkerAgent(WorkerConfig config, std::vector<std::unique_ptr<Tool>> tools,
                         std::unique_ptr<MasterLink> master)
    : config_(std::move(config)),
      logger_("worker", config_.log_file, parse_log_level(config_.log_level)),
      master_(std::move(master)), worker_id_(config_.worker_id), timer_(io_context_),
      rng_(std::random_device{}()) {
  if (!master_) {
    throw std::invalid_argument("WorkerAgent requires a master link");
  }
  for (auto &tool : tools) {
    if (!tool) {
      continue;
    }
    std::string name = tool->name();
    if (tools_.count(name)) {
      throw std::invalid_argument("Tool hosted twice: " + name);
    }
    logger_.info("Loaded tool: {}", name);
    tools_.emplace(name, std::move(tool));
  }
  if (tools_.empty()) {
    throw std::invalid_argument("WorkerAgent requires at least one tool");
  }

  server_.new_task_queue = [this] {
    return new httplib::ThreadPool(std::max<size_t>(config_.http_threads, 1));
  };
  register_routes();
}

WorkerAgent::~WorkerAgent() { stop(); }

Tool &WorkerAgent::find_tool(const std::string &tool_name) const {
  auto it = tools_.find(tool_name);
  if (it == tools_.end()) {
    throw UnknownTool(tool_name);
  }
  return *it->second;
}

std::vector<std::string> WorkerAgent::tool_names() const {
  std::vector<std::string> names;
  for (const auto &[name, tool] : tools_) {
    names.push_back(name);
  }
  return names;
}

std::string WorkerAgent::worker_id() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return worker_id_;
}

std::string WorkerAgent::base_url() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return base_url_;
}

nlohmann::json WorkerAgent::handle_create(const std::string &tool_name,
                                          const nlohmann::json &body) {
  Tool &tool = find_tool(tool_name);
  std::string instance_id;
  nlohmann::json identity = nlohmann::json::object();
  if (body.is_object()) {
    if (body.contains("instance_id") && body["instance_id"].is_string()) {
      instance_id = body["instance_id"].get<std::string>();
    }
    if (body.contains("identity") && !body["identity"].is_null()) {
      identity = body["identity"];
    }
  }

  std::string created = tool.create(instance_id, identity);
  logger_.debug("{} created instance {}", tool_name, created);
  return nlohmann::json{{"success", true}, {"result", created}};
}

nlohmann::json WorkerAgent::handle_execute(const std::string &tool_name,
                                           const nlohmann::json &body) {
  Tool &tool = find_tool(tool_name);
  std::string instance_id = require_instance_id(body);

  nlohmann::json parameters;
  if (body.contains("parameters") && body["parameters"].is_object()) {
    parameters = body["parameters"];
  } else {
    parameters = body;
    parameters.erase("instance_id");
  }

  ToolResult result = tool.execute(instance_id, parameters);
  logger_.debug("{} executed on {}: reward {}", tool_name, instance_id, result.reward_score);
  return result.to_json();
}

nlohmann::json WorkerAgent::handle_release(const std::string &tool_name,
                                           const nlohmann::json &body) {
  Tool &tool = find_tool(tool_name);
  std::string instance_id = require_instance_id(body);
  bool existed = tool.release(instance_id);
  logger_.debug("{} released instance {} (existed: {})", tool_name, instance_id, existed);
  return nlohmann::json{{"success", true}, {"result", existed}};
}

nlohmann::json WorkerAgent::handle_calc_reward(const std::string &tool_name,
                                               const nlohmann::json &body) {
  Tool &tool = find_tool(tool_name);
  std::string instance_id = require_instance_id(body);
  return nlohmann::json{{"reward_score", tool.calc_reward(instance_id)}};
}

nlohmann::json WorkerAgent::health() const {
  nlohmann::json instances = nlohmann::json::object();
  for (const auto &[name, tool] : tools_) {
    instances[name] = tool->instance_count();
  }
  return nlohmann::json{{"status", "healthy"},
                        {"worker_id", worker_id()},
                        {"tools", tool_names()},
                        {"registered", is_registered()},
                        {"master_url", config_.master_url},
                        {"instances", instances}};
}

void WorkerAgent::register_routes() {
  server_.Get("/health", [this](const httplib::Request &, httplib::Response &res) {
    send_json(res, 200, health());
  });

  server_.Post(R"(/([^/]+)/(create|execute|release|calc_reward))",
               [this](const httplib::Request &req, httplib::Response &res) {
                 std::string tool_name = req.matches[1];
                 std::string action = req.matches[2];
                 try {
                   nlohmann::json body = parse_json_body(req);
                   if (action == "create") {
                     send_json(res, 200, handle_create(tool_name, body));
                   } else if (action == "execute") {
                     send_json(res, 200, handle_execute(tool_name, body));
                   } else if (action == "release") {
                     send_json(res, 200, handle_release(tool_name, body));
                   } else {
                     send_json(res, 200, handle_calc_reward(tool_name, body));
                   }
                 } catch (const UnknownTool &e) {
                   send_json(res, 404, nlohmann::json{{"success", false}, {"error", e.what()}});
                 } catch (const UnknownInstance &e) {
                   send_json(res, 404, nlohmann::json{{"success", false}, {"error", e.what()}});
                 } catch (const ValidationError &e) {
                   send_json(res, 400, nlohmann::json{{"success", false}, {"error", e.what()}});
                 } catch (const std::exception &e) {
                   logger_.error("{} {} failed: {}", tool_name, action, e.what());
                   if (action == "create" || action == "release") {
                     // create and release report tool failures in the body
                     send_json(res, 200, nlohmann::json{{"success", false}, {"error", e.what()}});
                   } else {
                     send_json(res, 500, nlohmann::json{{"success", false}, {"error", e.what()}});
                   }
                 }
               });
}

WorkerRegistration WorkerAgent::make_registration() const {
  WorkerRegistration registration;
  registration.worker_id = worker_id();
  registration.base_url = base_url();
  for (const auto &[name, tool] : tools_) {
    registration.supported_tools.insert(name);
  }
  registration.host_info.hostname = local_hostname();
  registration.host_info.ip = external_ip();
  registration.host_info.port = bound_port_;
  return registration;
}

bool WorkerAgent::register_once() {
  registration_attempts_.fetch_add(1, std::memory_order_acq_rel);
  try {
    std::string assigned = master_->register_worker(make_registration());
    {
      std::lock_guard<std::mutex> lock(identity_mutex_);
      worker_id_ = assigned;
    }
    registered_.store(true, std::memory_order_release);
    logger_.info("Registered with master {} as worker {}", config_.master_url, assigned);
    return true;
  } catch (const MasterUnavailable &e) {
    logger_.warn("Registration failed: {}", e.what());
    return false;
  }
}

bool WorkerAgent::heartbeat_once() {
  std::string id = worker_id();
  try {
    master_->heartbeat(id);
    logger_.trace("Heartbeat sent for {}", id);
    return true;
  } catch (const UnknownWorker &) {
    registered_.store(false, std::memory_order_release);
    logger_.warn("Master does not know worker {}, re-registering", id);
    return false;
  } catch (const MasterUnavailable &e) {
    logger_.warn("Heartbeat failed: {}", e.what());
    return true;
  }
}

std::chrono::milliseconds WorkerAgent::next_backoff(size_t attempt) {
  long long span = std::max<long long>(config_.register_initial_backoff.count(), 1);
  std::uniform_int_distribution<long long> dist(0, span - 1);
  return registration_backoff(attempt, config_.register_initial_backoff,
                              config_.register_max_backoff, std::chrono::milliseconds(dist(rng_)));
}

void WorkerAgent::schedule_registration(size_t attempt, std::chrono::milliseconds delay) {
  timer_.expires_after(delay);
  timer_.async_wait([this, attempt](const std::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    if (register_once()) {
      schedule_heartbeat();
      return;
    }
    if (config_.register_max_attempts > 0 && attempt + 1 >= config_.register_max_attempts) {
      logger_.error("Giving up on registration after {} attempts", attempt + 1);
      return;
    }
    std::chrono::milliseconds wait = next_backoff(attempt);
    logger_.info("Retrying registration in {} ms", wait.count());
    schedule_registration(attempt + 1, wait);
  });
}

void WorkerAgent::schedule_heartbeat() {
  timer_.expires_after(config_.heartbeat_interval);
  timer_.async_wait([this](const std::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    if (heartbeat_once()) {
      schedule_heartbeat();
    } else {
      schedule_registration(0, std::chrono::milliseconds(0));
    }
  });
}

void WorkerAgent::start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  if (config_.port == 0) {
    bound_port_ = server_.bind_to_any_port(config_.host);
  } else {
    bound_port_ = server_.bind_to_port(config_.host, config_.port) ? config_.port : -1;
  }
  if (bound_port_ < 0) {
    running_.store(false, std::memory_order_release);
    throw std::runtime_error("Failed to bind worker server to " + config_.host + ":" +
                             std::to_string(config_.port));
  }

  {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    if (!config_.advertise_url.empty()) {
      base_url_ = normalize_base_url(config_.advertise_url);
    } else {
      // a wildcard bind is advertised under the address that routes outwards
      bool wildcard = config_.host.empty() || config_.host == "0.0.0.0" || config_.host == "::";
      base_url_ = "http://" + (wildcard ? external_ip() : config_.host) + ":" +
                  std::to_string(bound_port_);
    }
  }

  server_thread_ = std::thread([this]() { server_.listen_after_bind(); });
  server_.wait_until_ready();
  logger_.info("Worker serving {} tools at {}", tools_.size(), base_url());

  io_context_.restart();
  schedule_registration(0, std::chrono::milliseconds(0));
  io_thread_ = std::thread([this]() { io_context_.run(); });
}

void WorkerAgent::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  asio::post(io_context_, [this]() { timer_.cancel(); });
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  server_.stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  registered_.store(false, std::memory_order_release);
  logger_.info("Worker stopped");
}

} // namespace tfc
