/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "config/tool_definitions.hpp"
#include "tool.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfc {

/**
 * @brief Builds hosted tools from tool definitions, keyed by the short class name.
 */
class ToolFactory {
public:
  using Creator = std::function<std::unique_ptr<Tool>(const ToolDefinition &)>;

  void register_tool(const std::string &class_name, Creator creator);

  /**
   * @throws std::invalid_argument for an unregistered class.
   */
  std::unique_ptr<Tool> create(const ToolDefinition &definition) const;

  bool has(const std::string &class_name) const;
  std::vector<std::string> available() const;

  void register_defaults();

private:
  std::unordered_map<std::string, Creator> creators_;
};

} // namespace tfc
