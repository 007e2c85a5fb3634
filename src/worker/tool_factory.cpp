/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "worker/tool_factory.hpp"

#include "tools/arithmetic_tool.hpp"

#include <algorithm>
#include <stdexcept>

namespace tfc {

void ToolFactory::register_tool(const std::string &class_name, Creator creator) {
  creators_[short_class_name(class_name)] = std::move(creator);
}

std::unique_ptr<Tool> ToolFactory::create(const ToolDefinition &definition) const {
  auto it = creators_.find(definition.tool_name());
  if (it == creators_.end()) {
    throw std::invalid_argument("Unknown tool class: " + definition.class_name);
  }
  std::unique_ptr<Tool> tool = it->second(definition);
  tool->set_schema(definition.tool_schema);
  return tool;
}

bool ToolFactory::has(const std::string &class_name) const {
  return creators_.count(short_class_name(class_name)) > 0;
}

std::vector<std::string> ToolFactory::available() const {
  std::vector<std::string> names;
  for (const auto &[name, creator] : creators_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

void ToolFactory::register_defaults() {
  register_tool("ArithmeticTool", [](const ToolDefinition &) -> std::unique_ptr<Tool> {
    return std::make_unique<ArithmeticTool>();
  });
}

} // namespace tfc
