#include "mcp/server.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace toolhost::mcp {

namespace {

constexpr const char* kUnknownError = "unknown error";

// Tool payloads are opaque; invalid UTF-8 in them is replaced rather than aborting the write.
void write_line(std::ostream& out, const json& message) {
  out << message.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
  out.flush();
}

DispatchResult make_failure(std::string message) {
  return DispatchResult{.result = nullptr,
                        .error = JsonRpcError{.code = kInternalError, .message = std::move(message)}};
}

}  // namespace

Method parse_method(std::string_view method) {
  if (method == "initialize") {
    return Method::INITIALIZE;
  }
  if (method == "notifications/initialized") {
    return Method::INITIALIZED;
  }
  if (method == "tools/list") {
    return Method::TOOLS_LIST;
  }
  if (method == "tools/call") {
    return Method::TOOLS_CALL;
  }
  return Method::UNKNOWN;
}

Server::Server(ToolRegistry tools, ServerOptions options)
    : tools_(std::move(tools)), options_(std::move(options)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  err << "[toolhost] " << options_.name << ' ' << options_.version << " started with " << tools_.size()
      << " tools.\n";

  std::string line;
  while (std::getline(in, line)) {
    handle_line(line, out, err);
  }

  err << "[toolhost] input closed; exiting\n";
  return 0;
}

void Server::handle_line(const std::string& line, std::ostream& out, std::ostream& err) const {
  auto request = decode_request(line);
  if (!request.has_value()) {
    if (options_.log_requests && !line.empty()) {
      err << "[toolhost] discarded malformed line (" << line.size() << " bytes)\n";
    }
    return;
  }

  if (options_.log_requests) {
    err << "[toolhost] request method=" << (request->method.empty() ? "<none>" : request->method)
        << (request->id.has_value() ? "" : " (notification)") << '\n';
  }

  const auto outcome = dispatch(*request);
  if (outcome.error.has_value()) {
    err << "Error: " << outcome.error->message << '\n';
  }

  if (!request->id.has_value() || !outcome.respond) {
    return;
  }

  if (outcome.error.has_value()) {
    write_line(out, make_error_response(*request->id, *outcome.error));
  } else {
    write_line(out, make_result_response(*request->id, outcome.result));
  }
}

DispatchResult Server::dispatch(const JsonRpcRequest& request) const {
  switch (parse_method(request.method)) {
    case Method::INITIALIZE:
      return DispatchResult{.result = handle_initialize()};
    case Method::INITIALIZED:
      return DispatchResult{.result = nullptr, .error = std::nullopt, .respond = false};
    case Method::TOOLS_LIST:
      try {
        return DispatchResult{.result = handle_tools_list()};
      } catch (const std::exception& ex) {
        return make_failure(ex.what());
      } catch (...) {
        return make_failure(kUnknownError);
      }
    case Method::TOOLS_CALL:
      return handle_tools_call(request.params);
    case Method::UNKNOWN:
      break;
  }
  // Unknown methods are ignored; callers with an id still get a null result.
  return DispatchResult{.result = nullptr};
}

json Server::handle_initialize() const {
  return json{{"protocolVersion", kProtocolVersion},
              {"capabilities", {{"tools", json::array()}}},
              {"serverInfo", {{"name", options_.name}, {"version", options_.version}}}};
}

json Server::handle_tools_list() const {
  json tools = json::array();
  for (const auto& tool : tools_.list()) {
    tools.push_back({{"name", tool->name()}, {"description", tool->description()}, {"inputSchema", tool->input_schema()}});
  }
  return json{{"tools", tools}};
}

DispatchResult Server::handle_tools_call(const json& params) const {
  std::string name;
  const auto name_it = params.find("name");
  if (name_it != params.end() && name_it->is_string()) {
    name = name_it->get<std::string>();
  }

  json arguments = json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end() && args_it->is_object()) {
    arguments = *args_it;
  }

  const auto tool = tools_.find(name);
  if (tool == nullptr) {
    return make_failure("Tool not found: " + name);
  }

  try {
    return DispatchResult{.result = tool->execute(arguments)};
  } catch (const std::exception& ex) {
    return make_failure(ex.what());
  } catch (...) {
    return make_failure(kUnknownError);
  }
}

}  // namespace toolhost::mcp
