#include "tools/redis_query.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace toolhost::tools {

namespace {

using mcp::json;

constexpr std::array<std::string_view, 35> kReadOnlyCommands = {
    "GET",    "MGET",    "STRLEN",   "EXISTS",  "TYPE",      "TTL",      "PTTL",          "KEYS",
    "SCAN",   "DBSIZE",  "INFO",     "HGET",    "HMGET",     "HGETALL",  "HKEYS",         "HVALS",
    "HLEN",   "LRANGE",  "LLEN",     "LINDEX",  "SMEMBERS",  "SCARD",    "SISMEMBER",     "ZRANGE",
    "ZCARD",  "ZSCORE",  "XRANGE",   "XLEN",    "ZRANGEBYSCORE",
    "TS.GET", "TS.RANGE", "TS.REVRANGE", "TS.MRANGE", "TS.INFO", "TS.QUERYINDEX",
};

std::string to_upper(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string allowed_command_list() {
  std::string out;
  for (const auto command : kReadOnlyCommands) {
    if (!out.empty()) {
      out += ", ";
    }
    out += command;
  }
  return out;
}

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

class RedisConnection {
 public:
  explicit RedisConnection(core::RedisConfig config) : config_(std::move(config)) {}

  void connect() {
    timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(config_.connect_timeout_ms / 1000U);
    timeout.tv_usec = static_cast<suseconds_t>((config_.connect_timeout_ms % 1000U) * 1000U);

    redisContext* raw = nullptr;
    if (!config_.unix_socket.empty()) {
      raw = redisConnectUnixWithTimeout(config_.unix_socket.c_str(), timeout);
    } else {
      raw = redisConnectWithTimeout(config_.host.c_str(), static_cast<int>(config_.port), timeout);
    }

    if (raw == nullptr) {
      throw std::runtime_error("connection failed: out of memory");
    }
    context_.reset(raw);

    if (context_->err != REDIS_OK) {
      throw std::runtime_error(std::string("connection failed: ") + context_->errstr);
    }

    if (!config_.password.empty()) {
      expect_ok(command({"AUTH", config_.password}), "AUTH");
    }

    if (config_.db != 0) {
      expect_ok(command({"SELECT", std::to_string(config_.db)}), "SELECT");
    }
  }

  RedisReplyPtr command(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<std::size_t> argv_len;
    argv.reserve(args.size());
    argv_len.reserve(args.size());
    for (const auto& arg : args) {
      argv.push_back(arg.data());
      argv_len.push_back(arg.size());
    }

    auto* raw = static_cast<redisReply*>(
        redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data()));
    if (raw == nullptr) {
      const std::string reason = context_->err != REDIS_OK ? context_->errstr : "no reply";
      throw std::runtime_error("command failed: " + reason);
    }
    return RedisReplyPtr(raw);
  }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const {
      if (context != nullptr) {
        redisFree(context);
      }
    }
  };

  static void expect_ok(const RedisReplyPtr& reply, const char* what) {
    if (reply->type == REDIS_REPLY_ERROR) {
      throw std::runtime_error(std::string(what) + " failed: " + (reply->str != nullptr ? reply->str : "unknown"));
    }
  }

  core::RedisConfig config_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

std::string reply_string(const redisReply* reply) {
  if (reply->str == nullptr) {
    return {};
  }
  return std::string(reply->str, reply->len);
}

json reply_to_json(const redisReply* reply) {
  if (reply == nullptr) {
    return nullptr;
  }

  switch (reply->type) {
    case REDIS_REPLY_STRING:
    case REDIS_REPLY_STATUS:
    case REDIS_REPLY_BIGNUM:
    case REDIS_REPLY_VERB:
      return reply_string(reply);
    case REDIS_REPLY_INTEGER:
      return reply->integer;
    case REDIS_REPLY_DOUBLE:
      return reply->dval;
    case REDIS_REPLY_BOOL:
      return reply->integer != 0;
    case REDIS_REPLY_NIL:
      return nullptr;
    case REDIS_REPLY_MAP: {
      json object = json::object();
      for (std::size_t i = 0; i + 1 < reply->elements; i += 2) {
        const auto key = reply_to_json(reply->element[i]);
        const auto field =
            key.is_string() ? key.get<std::string>() : key.dump(-1, ' ', false, json::error_handler_t::replace);
        object[field] = reply_to_json(reply->element[i + 1]);
      }
      return object;
    }
    case REDIS_REPLY_ARRAY:
    case REDIS_REPLY_SET:
    case REDIS_REPLY_PUSH: {
      json array = json::array();
      for (std::size_t i = 0; i < reply->elements; ++i) {
        array.push_back(reply_to_json(reply->element[i]));
      }
      return array;
    }
    default:
      break;
  }
  return nullptr;
}

}  // namespace

std::vector<std::string> split_command(std::string_view command) {
  std::vector<std::string> args;
  std::string current;
  bool in_token = false;
  bool in_quotes = false;

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char c = command[i];
    if (in_quotes) {
      if (c == '\\' && i + 1 < command.size() && (command[i + 1] == '"' || command[i + 1] == '\\')) {
        current.push_back(command[++i]);
      } else if (c == '"') {
        in_quotes = false;
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (in_token) {
        args.push_back(std::move(current));
        current.clear();
        in_token = false;
      }
      continue;
    }

    in_token = true;
    if (c == '"') {
      in_quotes = true;
    } else {
      current.push_back(c);
    }
  }

  if (in_quotes) {
    throw std::invalid_argument("command has an unterminated quote");
  }
  if (in_token) {
    args.push_back(std::move(current));
  }
  return args;
}

bool is_read_only_command(std::string_view verb) {
  const auto upper = to_upper(verb);
  return std::find(kReadOnlyCommands.begin(), kReadOnlyCommands.end(), upper) != kReadOnlyCommands.end();
}

RedisQueryTool::RedisQueryTool(core::RedisConfig config) : config_(std::move(config)) {}

std::string RedisQueryTool::name() const {
  return "redis_query";
}

std::string RedisQueryTool::description() const {
  return "Execute a read-only command against the Redis database. Use this to inspect keys or retrieve data. "
         "Allowed commands: " +
         allowed_command_list() + ".";
}

mcp::json RedisQueryTool::input_schema() const {
  return json{{"type", "object"},
              {"properties",
               {{"command", {{"type", "string"}, {"description", "The Redis command to execute, e.g. GET user:42"}}},
                {"db",
                 {{"type", "integer"},
                  {"description", "Optional database index to select for this command"},
                  {"minimum", 0}}}}},
              {"required", {"command"}}};
}

mcp::json RedisQueryTool::execute(const mcp::json& arguments) {
  const auto command_it = arguments.find("command");
  if (command_it == arguments.end() || !command_it->is_string()) {
    throw std::invalid_argument("command must be a string");
  }
  const auto& command = command_it->get_ref<const std::string&>();

  core::RedisConfig config = config_;
  const auto db_it = arguments.find("db");
  if (db_it != arguments.end()) {
    if (!db_it->is_number_integer() || db_it->get<long long>() < 0 ||
        db_it->get<long long>() > std::numeric_limits<int>::max()) {
      throw std::invalid_argument("db must be a non-negative integer");
    }
    config.db = db_it->get<int>();
  }

  const auto args = split_command(command);
  if (args.empty() || !is_read_only_command(args.front())) {
    return mcp::make_error_result("Error: Only read-only commands (" + allowed_command_list() +
                                  ") are allowed. Your command: " + command);
  }

  try {
    RedisConnection redis(std::move(config));
    redis.connect();

    const auto reply = redis.command(args);
    if (reply->type == REDIS_REPLY_ERROR) {
      return mcp::make_error_result("Redis error: " + reply_string(reply.get()));
    }
    // Binary values are not valid UTF-8; their bytes are replaced instead of failing the dump.
    return mcp::make_text_result(reply_to_json(reply.get()).dump(2, ' ', false, json::error_handler_t::replace));
  } catch (const std::runtime_error& ex) {
    std::cerr << "[redis_query] " << ex.what() << '\n';
    return mcp::make_error_result(std::string("Redis error: ") + ex.what());
  }
}

}  // namespace toolhost::tools
