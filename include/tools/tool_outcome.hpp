#pragma once

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace file_server::tools {

enum class OutcomeKind {
  ok,
  invalid_argument,
  out_of_bounds,
  not_found,
  wrong_type,
  io_failure,
  unknown_tool,
};

// Result of one tool call. Clients only ever see `text`; `kind` is the
// structured tag the server uses internally.
struct ToolOutcome {
  OutcomeKind kind{OutcomeKind::ok};
  std::string text;

  bool ok() const { return kind == OutcomeKind::ok; }

  static ToolOutcome success(std::string text) { return ToolOutcome{OutcomeKind::ok, std::move(text)}; }
  static ToolOutcome failure(OutcomeKind kind, std::string text) { return ToolOutcome{kind, std::move(text)}; }
};

const char* outcome_kind_name(OutcomeKind kind);

// {"content": [{"type": "text", "text": ...}]}
nlohmann::json to_call_result(const ToolOutcome& outcome);

}  // namespace file_server::tools
