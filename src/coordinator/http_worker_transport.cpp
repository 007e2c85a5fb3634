/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "coordinator/http_worker_transport.hpp"

#include "common/errors.hpp"

#include <httplib.h>

namespace tfc {

static void apply_timeout(httplib::Client &client, std::chrono::milliseconds timeout) {
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
}

nlohmann::json HttpWorkerTransport::post(const std::string &base_url, const std::string &path,
                                         const nlohmann::json &body,
                                         std::chrono::milliseconds timeout) {
  httplib::Client client(base_url);
  if (!client.is_valid()) {
    throw WorkerUnreachable("Invalid worker address: " + base_url);
  }
  apply_timeout(client, timeout);

  auto start = std::chrono::steady_clock::now();
  auto res = client.Post(path, body.dump(), "application/json");
  auto elapsed = std::chrono::steady_clock::now() - start;

  const std::string target = base_url + path;
  if (!res) {
    httplib::Error err = res.error();
    if (err == httplib::Error::Read || elapsed >= timeout) {
      throw WorkerTimeout("Worker call " + target + " exceeded " +
                          std::to_string(timeout.count()) + " ms");
    }
    throw WorkerUnreachable("Request to " + target + " failed: " + httplib::to_string(err));
  }

  if (res->status < 200 || res->status >= 300) {
    throw WorkerError("Worker returned " + std::to_string(res->status) + ": " + res->body,
                      res->status);
  }

  nlohmann::json reply = nlohmann::json::parse(res->body, nullptr, false);
  if (reply.is_discarded()) {
    throw WorkerError("Worker returned a non-JSON body from " + target, res->status);
  }
  return reply;
}

bool HttpWorkerTransport::check_health(const std::string &base_url,
                                       std::chrono::milliseconds timeout) {
  httplib::Client client(base_url);
  if (!client.is_valid()) {
    return false;
  }
  apply_timeout(client, timeout);
  auto res = client.Get("/health");
  return res && res->status == 200;
}

}  // namespace tfc
