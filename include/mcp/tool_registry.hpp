#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcp/tool.hpp"

namespace toolhost::mcp {

// Name -> tool lookup that remembers registration order for tools/list.
class ToolRegistry {
 public:
  // Replaces an existing tool with the same name in place.
  void register_tool(std::shared_ptr<Tool> tool);

  [[nodiscard]] std::shared_ptr<Tool> find(const std::string& name) const;
  [[nodiscard]] const std::vector<std::shared_ptr<Tool>>& list() const { return tools_; }
  [[nodiscard]] std::size_t size() const { return tools_.size(); }
  [[nodiscard]] bool empty() const { return tools_.empty(); }

 private:
  std::vector<std::shared_ptr<Tool>> tools_{};
  std::unordered_map<std::string, std::size_t> index_{};
};

}  // namespace toolhost::mcp
