#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "mcp/server.hpp"
#include "mcp/tool_registry.hpp"
#include "tools/redis_query.hpp"

namespace {

std::string format_config_settings(const toolhost::core::ServerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[toolhost] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | name=" << config.name << " | version=" << config.version
         << " | log_requests=" << (config.log_requests ? "true" : "false")
         << " | redis_query=" << (config.redis_query_enabled ? "true" : "false");

  if (config.redis_query_enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

toolhost::mcp::ToolRegistry build_tool_registry(const toolhost::core::ServerConfig& config) {
  toolhost::mcp::ToolRegistry registry;
  if (config.redis_query_enabled) {
    registry.register_tool(std::make_shared<toolhost::tools::RedisQueryTool>(config.redis));
  }
  return registry;
}

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";

  toolhost::core::ServerConfig config{};
  try {
    if (!config_path.empty()) {
      config = toolhost::core::load_server_config(config_path);
    }
    toolhost::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  toolhost::mcp::Server server(build_tool_registry(config),
                               toolhost::mcp::ServerOptions{
                                   .name = config.name, .version = config.version, .log_requests = config.log_requests});
  return server.run(std::cin, std::cout, std::cerr);
}
