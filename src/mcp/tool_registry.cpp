#include "mcp/tool_registry.hpp"

#include <stdexcept>
#include <utility>

namespace toolhost::mcp {

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (tool == nullptr) {
    throw std::invalid_argument("cannot register a null tool");
  }

  auto name = tool->name();
  const auto it = index_.find(name);
  if (it != index_.end()) {
    tools_[it->second] = std::move(tool);
    return;
  }

  index_.emplace(std::move(name), tools_.size());
  tools_.push_back(std::move(tool));
}

std::shared_ptr<Tool> ToolRegistry::find(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return tools_[it->second];
}

}  // namespace toolhost::mcp
