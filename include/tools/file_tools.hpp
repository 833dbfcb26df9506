#pragma once

#include <nlohmann/json.hpp>

#include "sandbox/path_resolver.hpp"
#include "tools/tool_outcome.hpp"

namespace file_server::tools {

// Handlers for the filesystem tools. Each takes the raw `arguments` object of a
// tools/call request, validates it, resolves the path through the sandbox and
// performs one operation. Handlers never throw; every failure is a ToolOutcome.
class FileTools {
 public:
  explicit FileTools(const sandbox::PathResolver& resolver);

  ToolOutcome read_file(const nlohmann::json& arguments) const;
  ToolOutcome write_file(const nlohmann::json& arguments) const;
  ToolOutcome list_directory(const nlohmann::json& arguments) const;
  ToolOutcome create_directory(const nlohmann::json& arguments) const;
  ToolOutcome delete_file(const nlohmann::json& arguments) const;

 private:
  const sandbox::PathResolver& resolver_;
};

}  // namespace file_server::tools
