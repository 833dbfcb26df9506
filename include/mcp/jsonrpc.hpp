#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace file_server::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerNotInitialized = -32002;

struct JsonRpcError {
  int code;
  std::string message;
};

// Raised for messages that are not valid JSON-RPC 2.0 envelopes.
class InvalidRequest : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  bool is_notification() const { return !id.has_value(); }
};

JsonRpcRequest parse_request(const nlohmann::json& request);

// A message without "method" but with "result" or "error" is a response sent by
// the peer, not a request.
bool is_response(const nlohmann::json& message);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace file_server::mcp
