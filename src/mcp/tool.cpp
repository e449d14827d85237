#include "mcp/tool.hpp"

#include <stdexcept>
#include <utility>

namespace toolhost::mcp {

FunctionTool::FunctionTool(std::string name, std::string description, json input_schema, ToolHandler handler)
    : name_(std::move(name)),
      description_(std::move(description)),
      input_schema_(std::move(input_schema)),
      handler_(std::move(handler)) {
  if (name_.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (!handler_) {
    throw std::invalid_argument("tool handler must be callable");
  }
}

json FunctionTool::execute(const json& arguments) {
  return handler_(arguments);
}

json make_text_result(const std::string& text) {
  return json{{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

json make_error_result(const std::string& text) {
  return json{{"isError", true}, {"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

}  // namespace toolhost::mcp
