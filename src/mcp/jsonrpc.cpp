#include "mcp/jsonrpc.hpp"

#include <utility>

namespace file_server::mcp {

namespace {

const nlohmann::json* find_member(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  return it == object.end() ? nullptr : &*it;
}

// Fractional ids are legal JSON-RPC but cannot be echoed back reliably.
bool is_acceptable_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw InvalidRequest("envelope is not an object");
  }

  const auto* version = find_member(message, "jsonrpc");
  if (version == nullptr || !version->is_string() || version->get_ref<const std::string&>() != kJsonRpcVersion) {
    throw InvalidRequest("unsupported jsonrpc version, expected \"2.0\"");
  }

  const auto* method = find_member(message, "method");
  if (method == nullptr || !method->is_string()) {
    throw InvalidRequest("missing method name");
  }

  std::optional<nlohmann::json> id;
  if (const auto* raw_id = find_member(message, "id"); raw_id != nullptr) {
    if (!is_acceptable_id(*raw_id)) {
      throw InvalidRequest("id must be a string, an integer or null");
    }
    id = *raw_id;
  }

  // Absent and null params both mean "no parameters".
  nlohmann::json params = nlohmann::json::object();
  if (const auto* raw_params = find_member(message, "params"); raw_params != nullptr && !raw_params->is_null()) {
    if (!raw_params->is_structured()) {
      throw InvalidRequest("params must be structured (object or array)");
    }
    params = *raw_params;
  }

  return JsonRpcRequest{.method = method->get<std::string>(), .params = std::move(params), .id = std::move(id)};
}

bool is_response(const nlohmann::json& message) {
  if (!message.is_object() || message.contains("method")) {
    return false;
  }
  return message.contains("result") || message.contains("error");
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  nlohmann::json response = nlohmann::json::object();
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["result"] = result;
  return response;
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  nlohmann::json response = nlohmann::json::object();
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["error"] = nlohmann::json{{"code", error.code}, {"message", error.message}};
  return response;
}

}  // namespace file_server::mcp
