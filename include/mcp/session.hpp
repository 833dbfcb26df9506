#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "mcp/jsonrpc.hpp"
#include "tools/dispatcher.hpp"

namespace file_server::mcp {

enum class SessionState {
  uninitialized,
  initialized,  // initialize answered, waiting for notifications/initialized
  serving,
  closed,
};

const char* session_state_name(SessionState state);

struct SessionOptions {
  std::string server_name{"file-server"};
  std::string server_version{"1.0.0"};
  bool log_requests{false};
};

// One MCP client over a newline-delimited JSON-RPC stream.
class Session {
 public:
  Session(SessionOptions options, const tools::Dispatcher& dispatcher);

  // Serves messages until `in` reaches EOF (returns 0). Returns 1 if reading
  // or writing the stream fails.
  int run(std::istream& in, std::ostream& out, std::ostream& err);

  // Handles one framed message and returns the response to send, if any.
  // Never throws for bad input.
  std::optional<nlohmann::json> handle_message(const std::string& line, std::ostream& err);

  SessionState state() const { return state_; }

 private:
  nlohmann::json handle_request(const JsonRpcRequest& request, std::ostream& err);
  void handle_notification(const JsonRpcRequest& request, std::ostream& err);
  nlohmann::json handle_initialize(const nlohmann::json& params, std::ostream& err);
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params, std::ostream& err) const;

  SessionOptions options_;
  const tools::Dispatcher& dispatcher_;
  SessionState state_{SessionState::uninitialized};
};

}  // namespace file_server::mcp
