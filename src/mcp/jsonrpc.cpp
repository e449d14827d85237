#include "mcp/jsonrpc.hpp"

#include <utility>

namespace toolhost::mcp {

std::optional<JsonRpcRequest> decode_request(std::string_view line) {
  auto request = json::parse(line.begin(), line.end(), nullptr, false);
  if (request.is_discarded() || !request.is_object() || request.empty()) {
    return std::nullopt;
  }

  JsonRpcRequest parsed{.method = {}, .params = json::object(), .id = std::nullopt};

  const auto method_it = request.find("method");
  if (method_it != request.end() && method_it->is_string()) {
    parsed.method = method_it->get<std::string>();
  }

  const auto params_it = request.find("params");
  if (params_it != request.end() && params_it->is_object()) {
    parsed.params = std::move(*params_it);
  }

  // A present-but-null id still asks for a response.
  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    parsed.id = std::move(*id_it);
  }

  return parsed;
}

json make_result_response(const json& id, const json& result) {
  return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

json make_error_response(const json& id, const JsonRpcError& error) {
  return json{{"jsonrpc", kJsonRpcVersion},
              {"id", id},
              {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace toolhost::mcp
