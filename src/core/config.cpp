#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolhost::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

// Position of a '#' that starts a comment, ignoring any inside a value that opens with a quote.
std::size_t find_comment(const std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if ((c == '"' || c == '\'') && (i == 0 || line[i - 1] == ' ' || line[i - 1] == ':')) {
      quote = c;
    } else if (c == '#') {
      return i;
    }
  }
  return std::string::npos;
}

// Drops one pair of matching surrounding quotes.
std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::uint16_t parse_port(const std::string& value, const char* key) {
  const auto parsed_port = std::stoi(value);
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error(std::string(key) + " port must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed_port);
}

int parse_db(const std::string& value, const char* key) {
  const auto db = std::stoi(value);
  if (db < 0) {
    throw std::runtime_error(std::string(key) + " must be greater than or equal to 0");
  }
  return db;
}

std::uint32_t parse_timeout_ms(const std::string& value, const char* key) {
  const auto timeout = std::stoll(value);
  if (timeout <= 0) {
    throw std::runtime_error(std::string(key) + " must be greater than 0");
  }
  if (timeout > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::runtime_error(std::string(key) + " is out of range");
  }
  return static_cast<std::uint32_t>(timeout);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = parse_port(value.substr(split + 1), "redis.address");
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "server.name") {
    if (value.empty()) {
      throw std::runtime_error("server.name must not be empty");
    }
    config.name = value;
    return;
  }

  if (key == "server.version") {
    config.version = value;
    return;
  }

  if (key == "log.requests") {
    config.log_requests = parse_bool(value);
    return;
  }

  if (key == "tools.redis_query") {
    config.redis_query_enabled = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    config.redis.db = parse_db(value, "redis.db");
    return;
  }

  if (key == "redis.connect_timeout_ms") {
    config.redis.connect_timeout_ms = parse_timeout_ms(value, "redis.connect_timeout_ms");
  }
}

const char* getenv_nonempty(const char* name) {
  const auto* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = find_comment(line);
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections.resize(depth + 1);
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_env_overrides(ServerConfig& config) {
  if (const auto* host = getenv_nonempty("TOOLHOST_REDIS_HOST"); host != nullptr) {
    config.redis.host = host;
    config.redis.unix_socket.clear();
    if (config.redis.port == 0) {
      config.redis.port = 6379;
    }
  }
  if (const auto* port = getenv_nonempty("TOOLHOST_REDIS_PORT"); port != nullptr) {
    config.redis.port = parse_port(port, "TOOLHOST_REDIS_PORT");
  }
  if (const auto* socket = getenv_nonempty("TOOLHOST_REDIS_UNIX_SOCKET"); socket != nullptr) {
    config.redis.unix_socket = socket;
  }
  if (const auto* password = std::getenv("TOOLHOST_REDIS_PASSWORD"); password != nullptr) {
    config.redis.password = password;
  }
  if (const auto* db = getenv_nonempty("TOOLHOST_REDIS_DB"); db != nullptr) {
    config.redis.db = parse_db(db, "TOOLHOST_REDIS_DB");
  }
  if (const auto* timeout = getenv_nonempty("TOOLHOST_REDIS_CONNECT_TIMEOUT_MS"); timeout != nullptr) {
    config.redis.connect_timeout_ms = parse_timeout_ms(timeout, "TOOLHOST_REDIS_CONNECT_TIMEOUT_MS");
  }
}

}  // namespace toolhost::core
