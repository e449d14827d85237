#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "mcp/tool.hpp"

namespace toolhost::tools {

// Runs a single read-only Redis command and returns the reply as pretty-printed JSON text.
class RedisQueryTool : public mcp::Tool {
 public:
  explicit RedisQueryTool(core::RedisConfig config = {});

  std::string name() const override;
  std::string description() const override;
  mcp::json input_schema() const override;
  mcp::json execute(const mcp::json& arguments) override;

 private:
  core::RedisConfig config_;
};

// Whitespace split; double quotes group words and \" escapes a quote inside them.
std::vector<std::string> split_command(std::string_view command);

bool is_read_only_command(std::string_view verb);

}  // namespace toolhost::tools
