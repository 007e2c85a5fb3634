/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "utils/http_json.hpp"

#include "common/errors.hpp"

namespace tfc {

void send_json(httplib::Response &res, int status, const nlohmann::json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

nlohmann::json parse_json_body(const httplib::Request &req) {
  if (req.body.empty()) {
    return nlohmann::json::object();
  }
  nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded()) {
    throw ValidationError("Request body is not valid JSON");
  }
  return body;
}

std::string normalize_base_url(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace tfc
