#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolhost::mcp {

// Insertion-ordered so envelopes and tool payloads keep their key order on the wire.
using json = nlohmann::ordered_json;

constexpr const char* kJsonRpcVersion = "2.0";
constexpr int kInternalError = -32603;

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  std::string method;
  json params;
  std::optional<json> id;
};

// Returns nullopt for lines that are not a non-empty JSON object.
std::optional<JsonRpcRequest> decode_request(std::string_view line);

json make_result_response(const json& id, const json& result);
json make_error_response(const json& id, const JsonRpcError& error);

}  // namespace toolhost::mcp
