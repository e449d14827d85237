#pragma once

#include <functional>
#include <string>

#include "mcp/jsonrpc.hpp"

namespace toolhost::mcp {

// A named capability exposed through tools/list and tools/call.
// name() is the registry key and must not change for the lifetime of the instance.
// execute() reports failures by throwing; the server turns them into error envelopes.
class Tool {
 public:
  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  virtual json input_schema() const = 0;
  virtual json execute(const json& arguments) = 0;
  virtual ~Tool() = default;
};

using ToolHandler = std::function<json(const json&)>;

class FunctionTool : public Tool {
 public:
  FunctionTool(std::string name, std::string description, json input_schema, ToolHandler handler);

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }
  json input_schema() const override { return input_schema_; }
  json execute(const json& arguments) override;

 private:
  std::string name_;
  std::string description_;
  json input_schema_;
  ToolHandler handler_;
};

// {"content":[{"type":"text","text":...}]}
json make_text_result(const std::string& text);

// {"isError":true,"content":[{"type":"text","text":...}]}
json make_error_result(const std::string& text);

}  // namespace toolhost::mcp
