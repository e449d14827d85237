#pragma once

#include <cstdint>
#include <string>

#include "core/version.hpp"

namespace toolhost::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
};

struct ServerConfig {
  std::string name{kServerName};
  std::string version{kServerVersion};
  bool log_requests{false};
  bool redis_query_enabled{false};
  RedisConfig redis{};
};

ServerConfig load_server_config(const std::string& path);

// TOOLHOST_REDIS_* environment variables take precedence over the file.
void apply_env_overrides(ServerConfig& config);

}  // namespace toolhost::core
