#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "core/version.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/tool_registry.hpp"

namespace toolhost::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

enum class Method {
  INITIALIZE,
  INITIALIZED,
  TOOLS_LIST,
  TOOLS_CALL,
  UNKNOWN,
};

Method parse_method(std::string_view method);

struct ServerOptions {
  std::string name{core::kServerName};
  std::string version{core::kServerVersion};
  bool log_requests{false};
};

// Outcome of one dispatched request. respond is false for notification-only methods.
struct DispatchResult {
  json result{};
  std::optional<JsonRpcError> error{};
  bool respond{true};
};

class Server {
 public:
  explicit Server(ToolRegistry tools, ServerOptions options = {});

  // Serves one request per line until `in` is exhausted. Only protocol envelopes go to `out`.
  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  DispatchResult dispatch(const JsonRpcRequest& request) const;

 private:
  void handle_line(const std::string& line, std::ostream& out, std::ostream& err) const;
  json handle_initialize() const;
  json handle_tools_list() const;
  DispatchResult handle_tools_call(const json& params) const;

  ToolRegistry tools_;
  ServerOptions options_;
};

}  // namespace toolhost::mcp
