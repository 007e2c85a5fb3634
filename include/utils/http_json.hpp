/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

namespace tfc {

void send_json(httplib::Response &res, int status, const nlohmann::json &body);

/**
 * @brief Parses the request body as JSON. An empty body is an empty object.
 * @throws ValidationError on malformed JSON.
 */
nlohmann::json parse_json_body(const httplib::Request &req);

/**
 * @brief Strips trailing slashes so that base_url + "/path" never doubles them.
 */
std::string normalize_base_url(std::string url);

} // namespace tfc
