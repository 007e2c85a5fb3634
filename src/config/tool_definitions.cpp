/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "config/tool_definitions.hpp"

#include <fstream>
#include <stdexcept>

namespace tfc {

std::string short_class_name(const std::string &class_name) {
  size_t pos = class_name.rfind('.');
  return pos == std::string::npos ? class_name : class_name.substr(pos + 1);
}

std::string ToolDefinition::tool_name() const { return short_class_name(class_name); }

ToolDefinition ToolDefinition::from_json(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("class_name") || !j["class_name"].is_string()) {
    throw std::invalid_argument("Tool definition requires a string class_name");
  }
  ToolDefinition def;
  def.class_name = j["class_name"].get<std::string>();
  if (j.contains("config") && j["config"].is_object()) {
    def.config = j["config"];
  }
  if (j.contains("tool_schema") && !j["tool_schema"].is_null()) {
    def.tool_schema = j["tool_schema"];
  }
  return def;
}

nlohmann::json ToolDefinition::to_json() const {
  return nlohmann::json{{"class_name", class_name}, {"config", config}, {"tool_schema", tool_schema}};
}

static const nlohmann::json &tools_array(const nlohmann::json &document) {
  if (!document.is_object() || !document.contains("tools") || !document["tools"].is_array()) {
    throw std::invalid_argument("Tool definition document has no 'tools' array");
  }
  return document["tools"];
}

std::vector<ToolDefinition> parse_tool_definitions(const nlohmann::json &document) {
  std::vector<ToolDefinition> definitions;
  for (const auto &entry : tools_array(document)) {
    definitions.push_back(ToolDefinition::from_json(entry));
  }
  return definitions;
}

std::vector<std::string> extract_tool_names(const nlohmann::json &document) {
  std::vector<std::string> names;
  for (const auto &def : parse_tool_definitions(document)) {
    names.push_back(def.tool_name());
  }
  return names;
}

nlohmann::json rewrite_for_master(const nlohmann::json &document, const std::string &master_url,
                                  std::optional<double> timeout_per_query,
                                  std::optional<std::string> proxy_class) {
  tools_array(document);

  std::string base = master_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  nlohmann::json rewritten = document;
  for (auto &entry : rewritten["tools"]) {
    ToolDefinition def = ToolDefinition::from_json(entry);
    if (!entry.contains("config") || !entry["config"].is_object()) {
      entry["config"] = nlohmann::json::object();
    }
    entry["config"]["mcp_server_url"] = base + "/tools/" + def.tool_name();
    if (timeout_per_query) {
      entry["config"]["timeout_per_query"] = *timeout_per_query;
    }
    if (proxy_class) {
      entry["class_name"] = *proxy_class;
    }
  }
  return rewritten;
}

std::unordered_map<std::string, std::chrono::milliseconds>
tool_timeouts(const nlohmann::json &document) {
  std::unordered_map<std::string, std::chrono::milliseconds> timeouts;
  for (const auto &def : parse_tool_definitions(document)) {
    auto it = def.config.find("timeout_per_query");
    if (it != def.config.end() && it->is_number() && it->get<double>() > 0) {
      timeouts[def.tool_name()] =
          std::chrono::milliseconds(static_cast<long long>(it->get<double>() * 1000.0));
    }
  }
  return timeouts;
}

nlohmann::json load_tool_definitions(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open tool definition file: " + path);
  }
  nlohmann::json document = nlohmann::json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    throw std::runtime_error("Tool definition file is not valid JSON: " + path);
  }
  try {
    tools_array(document);
  } catch (const std::invalid_argument &e) {
    throw std::runtime_error(std::string(e.what()) + ": " + path);
  }
  return document;
}

void save_tool_definitions(const nlohmann::json &document, const std::string &path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write tool definition file: " + path);
  }
  file << document.dump(2) << std::endl;
  if (!file) {
    throw std::runtime_error("Failed writing tool definition file: " + path);
  }
}

} // namespace tfc
