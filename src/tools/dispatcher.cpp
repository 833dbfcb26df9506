#include "tools/dispatcher.hpp"

#include <stdexcept>

namespace file_server::tools {

Dispatcher::Dispatcher(const sandbox::PathResolver& resolver) : file_tools_(resolver) {
  const FileTools& tools = file_tools_;
  handlers_.emplace("read_file", [&tools](const nlohmann::json& args) { return tools.read_file(args); });
  handlers_.emplace("write_file", [&tools](const nlohmann::json& args) { return tools.write_file(args); });
  handlers_.emplace("list_directory", [&tools](const nlohmann::json& args) { return tools.list_directory(args); });
  handlers_.emplace("create_directory",
                    [&tools](const nlohmann::json& args) { return tools.create_directory(args); });
  handlers_.emplace("delete_file", [&tools](const nlohmann::json& args) { return tools.delete_file(args); });

  for (const auto& descriptor : tool_catalog()) {
    if (handlers_.find(descriptor.name) == handlers_.end()) {
      throw std::logic_error("no handler registered for tool " + descriptor.name);
    }
  }
}

const std::vector<ToolDescriptor>& Dispatcher::list_tools() const {
  return tool_catalog();
}

ToolOutcome Dispatcher::dispatch(const std::string& name, const nlohmann::json& arguments) const {
  const auto handler_it = handlers_.find(name);
  if (handler_it == handlers_.end()) {
    return ToolOutcome::failure(OutcomeKind::unknown_tool, "Unknown tool: " + name);
  }
  return handler_it->second(arguments.is_null() ? nlohmann::json::object() : arguments);
}

}  // namespace file_server::tools
