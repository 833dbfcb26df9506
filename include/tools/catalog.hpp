#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace file_server::tools {

struct ToolDescriptor {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

// The five filesystem tools, in advertised order. Built once on first use.
const std::vector<ToolDescriptor>& tool_catalog();

nlohmann::json to_json(const ToolDescriptor& descriptor);

}  // namespace file_server::tools
