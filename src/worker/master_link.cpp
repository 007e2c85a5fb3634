/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "worker/master_link.hpp"

#include "common/errors.hpp"
#include "utils/http_json.hpp"

#include <httplib.h>

namespace tfc {

HttpMasterLink::HttpMasterLink(std::string master_url, std::chrono::milliseconds timeout)
    : master_url_(normalize_base_url(std::move(master_url))), timeout_(timeout) {}

static httplib::Client make_client(const std::string &master_url,
                                   std::chrono::milliseconds timeout) {
  httplib::Client client(master_url);
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
  return client;
}

std::string HttpMasterLink::register_worker(const WorkerRegistration &registration) {
  httplib::Client client = make_client(master_url_, timeout_);
  if (!client.is_valid()) {
    throw MasterUnavailable("Invalid master address: " + master_url_);
  }

  auto res = client.Post("/register", registration.to_json().dump(), "application/json");
  if (!res) {
    throw MasterUnavailable("Cannot reach master at " + master_url_ + ": " +
                            httplib::to_string(res.error()));
  }

  nlohmann::json reply = nlohmann::json::parse(res->body, nullptr, false);
  if (res->status != 200) {
    std::string reason = !reply.is_discarded() && reply.contains("error") && reply["error"].is_string()
                             ? reply["error"].get<std::string>()
                             : res->body;
    throw MasterUnavailable("Master rejected registration (" + std::to_string(res->status) +
                            "): " + reason);
  }
  if (reply.is_discarded() || !reply.contains("worker_id") || !reply["worker_id"].is_string()) {
    throw MasterUnavailable("Master sent a malformed registration reply");
  }
  return reply["worker_id"].get<std::string>();
}

void HttpMasterLink::heartbeat(const std::string &worker_id) {
  httplib::Client client = make_client(master_url_, timeout_);
  if (!client.is_valid()) {
    throw MasterUnavailable("Invalid master address: " + master_url_);
  }

  auto res = client.Put("/heartbeat/" + worker_id);
  if (!res) {
    throw MasterUnavailable("Cannot reach master at " + master_url_ + ": " +
                            httplib::to_string(res.error()));
  }
  if (res->status == 404) {
    throw UnknownWorker(worker_id);
  }
  if (res->status != 200) {
    throw MasterUnavailable("Heartbeat rejected with status " + std::to_string(res->status));
  }
}

} // namespace tfc
