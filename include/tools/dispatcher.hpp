#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "sandbox/path_resolver.hpp"
#include "tools/catalog.hpp"
#include "tools/file_tools.hpp"
#include "tools/tool_outcome.hpp"

namespace file_server::tools {

using ToolHandler = std::function<ToolOutcome(const nlohmann::json&)>;

class Dispatcher {
 public:
  explicit Dispatcher(const sandbox::PathResolver& resolver);

  // Handlers hold a reference to file_tools_.
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  const std::vector<ToolDescriptor>& list_tools() const;

  // Unknown names yield OutcomeKind::unknown_tool; never throws.
  ToolOutcome dispatch(const std::string& name, const nlohmann::json& arguments) const;

 private:
  FileTools file_tools_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

}  // namespace file_server::tools
