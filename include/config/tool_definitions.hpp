/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfc {

/**
 * One entry of a tool-definition document:
 *   {"tools": [{"class_name": "pkg.module.ArithmeticTool", "config": {...}, "tool_schema": {...}}]}
 */
struct ToolDefinition {
  std::string class_name;
  nlohmann::json config = nlohmann::json::object();
  nlohmann::json tool_schema = nlohmann::json::object();

  // Last dotted component of class_name, which is also the routed tool name.
  std::string tool_name() const;

  static ToolDefinition from_json(const nlohmann::json &j);
  nlohmann::json to_json() const;
};

std::string short_class_name(const std::string &class_name);

/**
 * @throws std::invalid_argument if the document has no "tools" array or an entry has no
 * class_name.
 */
std::vector<ToolDefinition> parse_tool_definitions(const nlohmann::json &document);

std::vector<std::string> extract_tool_names(const nlohmann::json &document);

/**
 * @brief Points every tool of the document at the coordinator.
 *
 * Each tool gets config.mcp_server_url = master_url + "/tools/" + name, config.timeout_per_query
 * when given, and class_name replaced by proxy_class when given. The input is not modified.
 */
nlohmann::json rewrite_for_master(const nlohmann::json &document, const std::string &master_url,
                                  std::optional<double> timeout_per_query = std::nullopt,
                                  std::optional<std::string> proxy_class = std::nullopt);

/**
 * @brief Per-tool timeout_per_query (seconds in the document).
 */
std::unordered_map<std::string, std::chrono::milliseconds>
tool_timeouts(const nlohmann::json &document);

/**
 * @throws std::runtime_error if the file cannot be read or is not valid JSON.
 */
nlohmann::json load_tool_definitions(const std::string &path);

/**
 * @throws std::runtime_error if the file cannot be written.
 */
void save_tool_definitions(const nlohmann::json &document, const std::string &path);

} // namespace tfc
