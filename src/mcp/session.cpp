#include "mcp/session.hpp"

#include <array>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace file_server::mcp {

namespace {

constexpr const char* kLogPrefix = "[file-server] ";

// Newest first; the first entry is offered when the client asks for something else.
constexpr std::array<const char*, 3> kSupportedProtocolVersions{"2025-06-18", "2025-03-26", "2024-11-05"};

std::string negotiate_protocol_version(const nlohmann::json& params) {
  const auto requested_it = params.find("protocolVersion");
  if (requested_it != params.end() && requested_it->is_string()) {
    const auto& requested = requested_it->get_ref<const std::string&>();
    for (const char* version : kSupportedProtocolVersions) {
      if (requested == version) {
        return requested;
      }
    }
  }
  return kSupportedProtocolVersions.front();
}

// Best-effort id for error responses to envelopes that failed validation.
nlohmann::json request_id_or_null(const nlohmann::json& message) {
  if (!message.is_object()) {
    return nullptr;
  }
  const auto id_it = message.find("id");
  if (id_it == message.end()) {
    return nullptr;
  }
  if (id_it->is_string() || id_it->is_number_integer() || id_it->is_number_unsigned()) {
    return *id_it;
  }
  return nullptr;
}

}  // namespace

const char* session_state_name(const SessionState state) {
  switch (state) {
    case SessionState::uninitialized:
      return "uninitialized";
    case SessionState::initialized:
      return "initialized";
    case SessionState::serving:
      return "serving";
    case SessionState::closed:
      return "closed";
  }
  return "unknown";
}

Session::Session(SessionOptions options, const tools::Dispatcher& dispatcher)
    : options_(std::move(options)), dispatcher_(dispatcher) {}

int Session::run(std::istream& in, std::ostream& out, std::ostream& err) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    const auto response = handle_message(line, err);
    if (!response.has_value()) {
      continue;
    }

    // File names are not guaranteed to be UTF-8; never let serialization fail.
    out << response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out.flush();
    if (!out) {
      err << kLogPrefix << "output stream failed; closing session\n";
      state_ = SessionState::closed;
      return 1;
    }
  }

  state_ = SessionState::closed;
  if (in.bad()) {
    err << kLogPrefix << "input stream failed; closing session\n";
    return 1;
  }

  err << kLogPrefix << "input closed; session ended\n";
  return 0;
}

std::optional<nlohmann::json> Session::handle_message(const std::string& line, std::ostream& err) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    err << kLogPrefix << "parse error: " << ex.what() << '\n';
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "Parse error"});
  }

  if (is_response(message)) {
    if (options_.log_requests) {
      err << kLogPrefix << "ignoring response message from client\n";
    }
    return std::nullopt;
  }

  JsonRpcRequest request;
  try {
    request = parse_request(message);
  } catch (const InvalidRequest& ex) {
    err << kLogPrefix << "invalid request: " << ex.what() << '\n';
    return make_error_response(request_id_or_null(message),
                               JsonRpcError{.code = kInvalidRequest, .message = ex.what()});
  }

  if (request.is_notification()) {
    handle_notification(request, err);
    return std::nullopt;
  }

  const nlohmann::json& id = *request.id;
  try {
    return handle_request(request, err);
  } catch (const std::invalid_argument& ex) {
    err << kLogPrefix << request.method << ": invalid params: " << ex.what() << '\n';
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const std::exception& ex) {
    err << kLogPrefix << request.method << ": failed to process request: " << ex.what() << '\n';
    return make_error_response(id, JsonRpcError{.code = kInternalError, .message = "Internal error"});
  }
}

nlohmann::json Session::handle_request(const JsonRpcRequest& request, std::ostream& err) {
  const nlohmann::json& id = *request.id;
  if (options_.log_requests) {
    err << kLogPrefix << "request " << request.method << " (state " << session_state_name(state_) << ")\n";
  }

  if (request.method == "ping") {
    return make_result_response(id, nlohmann::json::object());
  }

  if (request.method == "initialize") {
    if (state_ != SessionState::uninitialized) {
      return make_error_response(id,
                                 JsonRpcError{.code = kInvalidRequest, .message = "Session already initialized"});
    }
    return make_result_response(id, handle_initialize(request.params, err));
  }

  if (state_ == SessionState::uninitialized) {
    err << kLogPrefix << request.method << " received before initialize\n";
    return make_error_response(id, JsonRpcError{.code = kServerNotInitialized, .message = "Server not initialized"});
  }

  if (request.method == "tools/list") {
    return make_result_response(id, handle_tools_list());
  }
  if (request.method == "tools/call") {
    return make_result_response(id, handle_tools_call(request.params, err));
  }

  err << kLogPrefix << "method not found: " << request.method << '\n';
  return make_error_response(id,
                             JsonRpcError{.code = kMethodNotFound, .message = "Method not found: " + request.method});
}

void Session::handle_notification(const JsonRpcRequest& request, std::ostream& err) {
  if (request.method == "notifications/initialized") {
    if (state_ == SessionState::initialized) {
      state_ = SessionState::serving;
      if (options_.log_requests) {
        err << kLogPrefix << "handshake complete\n";
      }
    } else {
      err << kLogPrefix << "unexpected initialized notification in state " << session_state_name(state_) << '\n';
    }
    return;
  }

  if (options_.log_requests) {
    err << kLogPrefix << "ignoring notification " << request.method << '\n';
  }
}

nlohmann::json Session::handle_initialize(const nlohmann::json& params, std::ostream& err) {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto protocol_version = negotiate_protocol_version(params);

  std::string client = "unknown client";
  const auto client_it = params.find("clientInfo");
  if (client_it != params.end() && client_it->is_object()) {
    const auto name_it = client_it->find("name");
    const auto version_it = client_it->find("version");
    if (name_it != client_it->end() && name_it->is_string()) {
      client = name_it->get<std::string>();
    }
    if (version_it != client_it->end() && version_it->is_string()) {
      client += " " + version_it->get<std::string>();
    }
  }
  err << kLogPrefix << "initialize from " << client << " (protocol " << protocol_version << ")\n";

  state_ = SessionState::initialized;
  return nlohmann::json{
      {"protocolVersion", protocol_version},
      {"capabilities", {{"tools", {{"listChanged", false}}}}},
      {"serverInfo", {{"name", options_.server_name}, {"version", options_.server_version}}}};
}

nlohmann::json Session::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& descriptor : dispatcher_.list_tools()) {
    tools.push_back(tools::to_json(descriptor));
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Session::handle_tools_call(const nlohmann::json& params, std::ostream& err) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("name must be a string");
  }

  nlohmann::json arguments = nlohmann::json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto& name = name_it->get_ref<const std::string&>();
  const auto outcome = dispatcher_.dispatch(name, arguments);
  if (options_.log_requests) {
    err << kLogPrefix << "tools/call " << name << " -> " << tools::outcome_kind_name(outcome.kind) << '\n';
  }
  return tools::to_call_result(outcome);
}

}  // namespace file_server::mcp
