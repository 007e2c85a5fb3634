/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "coordinator/coordinator.hpp"

#include "common/errors.hpp"
#include "utils/http_json.hpp"

#include <stdexcept>

namespace tfc {

static std::string require_instance_id(const nlohmann::json &body) {
  if (!body.is_object() || !body.contains("instance_id") || !body["instance_id"].is_string() ||
      body["instance_id"].get<std::string>().empty()) {
    throw ValidationError("instance_id is required");
  }
  return body["instance_id"].get<std::string>();
}

static std::string reply_error(const nlohmann::json &reply, const std::string &fallback) {
  if (reply.is_object() && reply.contains("error") && reply["error"].is_string()) {
    return reply["error"].get<std::string>();
  }
  return fallback;
}

static std::unique_ptr<WorkerTransport> require_transport(std::unique_ptr<WorkerTransport> transport) {
  if (!transport) {
    throw std::invalid_argument("Coordinator requires a worker transport");
  }
  return transport;
}

CreateRequest CreateRequest::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ValidationError("Create body must be a JSON object");
  }
  CreateRequest request;
  if (j.contains("instance_id") && !j["instance_id"].is_null()) {
    if (!j["instance_id"].is_string()) {
      throw ValidationError("instance_id must be a string");
    }
    request.instance_id = j["instance_id"].get<std::string>();
  }
  if (j.contains("identity") && !j["identity"].is_null()) {
    request.identity = j["identity"];
  }
  return request;
}

Coordinator::Coordinator(CoordinatorConfig config, std::unique_ptr<WorkerTransport> transport,
                         WorkerRegistry::TimeSource now)
    : config_(std::move(config)),
      logger_("master", config_.log_file, parse_log_level(config_.log_level)),
      transport_(require_transport(std::move(transport))), registry_(std::move(now)),
      health_monitor_(registry_, *transport_, config_, logger_) {}

Coordinator::~Coordinator() { stop(); }

void Coordinator::start() { health_monitor_.start(); }

void Coordinator::stop() { health_monitor_.stop(); }

RegistrationOutcome Coordinator::register_worker(WorkerRegistration registration) {
  registration.base_url = normalize_base_url(registration.base_url);

  if (config_.verify_worker_on_register && !registration.base_url.empty() &&
      !registration.supported_tools.empty()) {
    if (!transport_->check_health(registration.base_url, config_.health_check_timeout)) {
      logger_.warn("Rejected registration of {}: health check failed",
                   registration.base_url);
      throw WorkerUnreachable("Cannot reach worker at " + registration.base_url);
    }
  }

  RegistrationOutcome outcome = registry_.register_worker(registration);

  std::string tools;
  for (const auto &tool : registration.supported_tools) {
    tools += (tools.empty() ? "" : ", ") + tool;
  }
  logger_.info("{} worker {} at {} with tools [{}] (host {} / {})",
               outcome.replaced ? "Re-registered" : "Registered", outcome.worker_id,
               registration.base_url, tools, registration.host_info.hostname,
               registration.host_info.ip);
  for (const auto &tool : outcome.new_tools) {
    logger_.info("  - discovered new tool: {}", tool);
  }
  for (const auto &instance_id : outcome.invalidated_instances) {
    logger_.warn("  - dropped instance mapping {} of the previous worker process", instance_id);
  }
  return outcome;
}

void Coordinator::heartbeat(const std::string &worker_id) {
  try {
    registry_.heartbeat(worker_id);
  } catch (const UnknownWorker &) {
    logger_.warn("Heartbeat from unregistered worker {}", worker_id);
    throw;
  }
}

std::vector<std::string> Coordinator::unregister_worker(const std::string &worker_id) {
  std::vector<std::string> invalidated = registry_.evict(worker_id);
  logger_.info("Worker {} unregistered ({} instance mappings cleared)", worker_id,
               invalidated.size());
  return invalidated;
}

nlohmann::json Coordinator::create_instance(const std::string &tool_name,
                                            const CreateRequest &request) {
  if (tool_name.empty()) {
    throw ValidationError("tool name is required");
  }

  InstanceReservation reservation =
      registry_.reserve_instance(tool_name, request.instance_id, request.identity);

  if (reservation.existing) {
    logger_.debug("{} create for bound instance {} returns worker {}", tool_name,
                  reservation.instance_id, reservation.worker_id);
    return nlohmann::json{{"success", true},
                          {"instance_id", reservation.instance_id},
                          {"worker_id", reservation.worker_id},
                          {"existing", true}};
  }

  logger_.info("{} create {} routed to {} ({}) [instances: {}]", tool_name,
               reservation.instance_id, reservation.worker_id, reservation.base_url,
               reservation.active_instance_count);

  nlohmann::json reply;
  try {
    reply = transport_->post(
        reservation.base_url, "/" + tool_name + "/create",
        nlohmann::json{{"instance_id", reservation.instance_id}, {"identity", request.identity}},
        config_.timeout_for(tool_name));
  } catch (const CoordinatorError &e) {
    registry_.cancel_instance(reservation);
    logger_.warn("{} create {} on worker {} failed: {}", tool_name, reservation.instance_id,
                 reservation.worker_id, e.what());
    throw;
  }

  if (!reply.is_object() || !reply.value("success", false)) {
    registry_.cancel_instance(reservation);
    std::string message = reply_error(reply, "worker rejected create");
    logger_.warn("{} create {} rejected by worker {}: {}", tool_name, reservation.instance_id,
                 reservation.worker_id, message);
    throw WorkerError(message, 200);
  }

  registry_.commit_instance(reservation);

  nlohmann::json result{{"success", true},
                        {"instance_id", reservation.instance_id},
                        {"worker_id", reservation.worker_id},
                        {"existing", false}};
  if (reply.contains("result")) {
    result["result"] = reply["result"];
  }
  return result;
}

nlohmann::json Coordinator::forward_bound(const std::string &tool_name, const std::string &action,
                                          const nlohmann::json &body) {
  std::string instance_id = require_instance_id(body);
  RouteTarget target = registry_.route_instance(instance_id, tool_name);

  logger_.debug("{} {} {} routed to {} ({}) [instances: {}]", tool_name, action, instance_id,
                target.worker_id, target.base_url, target.active_instance_count);

  return transport_->post(target.base_url, "/" + tool_name + "/" + action, body,
                          config_.timeout_for(tool_name));
}

nlohmann::json Coordinator::execute(const std::string &tool_name, const nlohmann::json &body) {
  return forward_bound(tool_name, "execute", body);
}

nlohmann::json Coordinator::calc_reward(const std::string &tool_name,
                                        const nlohmann::json &body) {
  return forward_bound(tool_name, "calc_reward", body);
}

nlohmann::json Coordinator::release(const std::string &tool_name, const nlohmann::json &body) {
  std::string instance_id = require_instance_id(body);

  RouteTarget target;
  try {
    target = registry_.route_instance(instance_id, tool_name);
  } catch (const InstanceNotBound &) {
    // a binding to a dead worker has nothing left to call; other tools' bindings stay
    if (registry_.release_orphaned_instance(instance_id)) {
      logger_.info("{} instance {} released (its worker is gone)", tool_name, instance_id);
    }
    throw;
  }

  nlohmann::json reply;
  try {
    reply = transport_->post(target.base_url, "/" + tool_name + "/release", body,
                             config_.timeout_for(tool_name));
  } catch (const CoordinatorError &e) {
    registry_.release_instance(instance_id);
    logger_.warn("{} release {} on worker {} failed, mapping cleared anyway: {}", tool_name,
                 instance_id, target.worker_id, e.what());
    throw;
  }

  registry_.release_instance(instance_id);
  logger_.info("{} instance {} released from worker {}", tool_name, instance_id,
               target.worker_id);
  return reply;
}

void Coordinator::declare_tools(const std::vector<std::string> &tool_names) {
  registry_.declare_tools(tool_names);
}

nlohmann::json Coordinator::health() const {
  nlohmann::json j = registry_.snapshot().to_json();
  j["heartbeat_timeout_ms"] = config_.heartbeat_timeout.count();
  j["sweep_interval_ms"] = config_.sweep_interval.count();
  return j;
}

}  // namespace tfc
