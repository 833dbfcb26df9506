#include "tools/tool_outcome.hpp"

namespace file_server::tools {

const char* outcome_kind_name(const OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::ok:
      return "ok";
    case OutcomeKind::invalid_argument:
      return "invalid_argument";
    case OutcomeKind::out_of_bounds:
      return "out_of_bounds";
    case OutcomeKind::not_found:
      return "not_found";
    case OutcomeKind::wrong_type:
      return "wrong_type";
    case OutcomeKind::io_failure:
      return "io_failure";
    case OutcomeKind::unknown_tool:
      return "unknown_tool";
  }
  return "unknown";
}

nlohmann::json to_call_result(const ToolOutcome& outcome) {
  return nlohmann::json{
      {"content", nlohmann::json::array({nlohmann::json{{"type", "text"}, {"text", outcome.text}}})}};
}

}  // namespace file_server::tools
