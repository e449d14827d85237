#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/config.hpp"
#include "core/version.hpp"

using toolhost::core::apply_env_overrides;
using toolhost::core::kServerName;
using toolhost::core::kServerVersion;
using toolhost::core::load_server_config;
using toolhost::core::ServerConfig;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const std::string& file_name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / file_name;
  std::ofstream output(path, std::ios::trunc);
  output << content;
  return path;
}

void clear_env() {
  for (const char* name : {"TOOLHOST_REDIS_HOST", "TOOLHOST_REDIS_PORT", "TOOLHOST_REDIS_UNIX_SOCKET",
                           "TOOLHOST_REDIS_PASSWORD", "TOOLHOST_REDIS_DB", "TOOLHOST_REDIS_CONNECT_TIMEOUT_MS"}) {
    unsetenv(name);
  }
}

int test_defaults() {
  const ServerConfig config{};
  if (config.name != kServerName || config.version != kServerVersion || config.log_requests ||
      config.redis_query_enabled) {
    return fail("test_defaults", "server defaults mismatch");
  }
  if (config.redis.host != "127.0.0.1" || config.redis.port != 6379 || config.redis.db != 0 ||
      config.redis.connect_timeout_ms != 1000) {
    return fail("test_defaults", "redis defaults mismatch");
  }
  return 0;
}

int test_load_full_config() {
  const auto path = write_config("toolhost_full.yaml",
                                 "# comment line\n"
                                 "server:\n"
                                 "  name: \"inventory-mcp\"\n"
                                 "  version: 2.3.4\n"
                                 "log:\n"
                                 "  requests: yes\n"
                                 "tools:\n"
                                 "  redis_query: on   # enable the example tool\n"
                                 "redis:\n"
                                 "  address: cache.local:6380\n"
                                 "  password: 'pa ss'\n"
                                 "  db: 4\n"
                                 "  connect_timeout_ms: 250\n"
                                 "unknown:\n"
                                 "  key: ignored\n");

  const auto config = load_server_config(path.string());
  std::filesystem::remove(path);

  if (config.name != "inventory-mcp" || config.version != "2.3.4" || !config.log_requests ||
      !config.redis_query_enabled) {
    return fail("test_load_full_config", "server section mismatch");
  }
  if (config.redis.host != "cache.local" || config.redis.port != 6380 || config.redis.password != "pa ss" ||
      config.redis.db != 4 || config.redis.connect_timeout_ms != 250 || !config.redis.unix_socket.empty()) {
    return fail("test_load_full_config", "redis section mismatch");
  }
  return 0;
}

int test_unix_socket_address() {
  const auto path = write_config("toolhost_unix.yaml", "redis:\n  address: unix:///run/redis/redis.sock\n");
  const auto config = load_server_config(path.string());
  std::filesystem::remove(path);

  if (config.redis.unix_socket != "/run/redis/redis.sock" || !config.redis.host.empty() || config.redis.port != 0) {
    return fail("test_unix_socket_address", "unix socket address mismatch");
  }
  return 0;
}

int test_hash_inside_quoted_value() {
  const auto path = write_config("toolhost_hash.yaml",
                                 "redis:\n"
                                 "  password: \"a#b\"   # trailing comment\n"
                                 "server:\n"
                                 "  name: 'ops # tools'\n"
                                 "  version: 1.0 # comment\n");
  const auto config = load_server_config(path.string());
  std::filesystem::remove(path);

  if (config.redis.password != "a#b" || config.name != "ops # tools" || config.version != "1.0") {
    return fail("test_hash_inside_quoted_value", "'#' inside quotes must not start a comment");
  }
  return 0;
}

int test_invalid_values_rejected() {
  const char* bad_configs[] = {
      "redis:\n  address: localhost:70000\n",
      "redis:\n  db: -1\n",
      "redis:\n  connect_timeout_ms: 0\n",
      "redis:\n  connect_timeout_ms: 4294967296\n",
      "server:\n  name: \"\"\n",
  };

  for (const char* content : bad_configs) {
    const auto path = write_config("toolhost_bad.yaml", content);
    bool threw = false;
    try {
      load_server_config(path.string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    std::filesystem::remove(path);
    if (!threw) {
      return fail("test_invalid_values_rejected", content);
    }
  }

  try {
    load_server_config("/nonexistent/toolhost.yaml");
    return fail("test_invalid_values_rejected", "missing file should throw");
  } catch (const std::runtime_error&) {
  }
  return 0;
}

int test_env_overrides() {
  clear_env();
  ServerConfig config{};
  config.redis.unix_socket = "/tmp/redis.sock";
  config.redis.port = 0;

  setenv("TOOLHOST_REDIS_HOST", "10.0.0.5", 1);
  setenv("TOOLHOST_REDIS_DB", "2", 1);
  setenv("TOOLHOST_REDIS_PASSWORD", "", 1);
  apply_env_overrides(config);

  if (config.redis.host != "10.0.0.5" || !config.redis.unix_socket.empty() || config.redis.port != 6379 ||
      config.redis.db != 2 || !config.redis.password.empty()) {
    clear_env();
    return fail("test_env_overrides", "environment overrides mismatch");
  }

  setenv("TOOLHOST_REDIS_PORT", "not-a-port", 1);
  bool threw = false;
  try {
    apply_env_overrides(config);
  } catch (const std::exception&) {
    threw = true;
  }
  clear_env();
  if (!threw) {
    return fail("test_env_overrides", "invalid port override should throw");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_defaults(); rc != 0) return rc;
  if (int rc = test_load_full_config(); rc != 0) return rc;
  if (int rc = test_unix_socket_address(); rc != 0) return rc;
  if (int rc = test_hash_inside_quoted_value(); rc != 0) return rc;
  if (int rc = test_invalid_values_rejected(); rc != 0) return rc;
  if (int rc = test_env_overrides(); rc != 0) return rc;

  std::cout << "[PASS] config unit tests\n";
  return 0;
}
