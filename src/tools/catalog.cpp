#include "tools/catalog.hpp"

namespace file_server::tools {

namespace {

nlohmann::json string_property(const char* description) {
  return nlohmann::json{{"type", "string"}, {"description", description}};
}

nlohmann::json path_only_schema(const char* path_description) {
  return nlohmann::json{{"type", "object"},
                        {"properties", {{"path", string_property(path_description)}}},
                        {"required", nlohmann::json::array({"path"})}};
}

std::vector<ToolDescriptor> build_catalog() {
  std::vector<ToolDescriptor> catalog;
  catalog.reserve(5);

  catalog.push_back(ToolDescriptor{.name = "read_file",
                                   .description = "Read the contents of a file",
                                   .input_schema = path_only_schema("The path to the file to read")});

  catalog.push_back(ToolDescriptor{
      .name = "write_file",
      .description = "Write content to a file",
      .input_schema = nlohmann::json{{"type", "object"},
                                     {"properties",
                                      {{"path", string_property("The path to the file to write")},
                                       {"content", string_property("The content to write to the file")}}},
                                     {"required", nlohmann::json::array({"path", "content"})}}});

  catalog.push_back(ToolDescriptor{.name = "list_directory",
                                   .description = "List the contents of a directory",
                                   .input_schema = path_only_schema("The path to the directory to list")});

  catalog.push_back(ToolDescriptor{.name = "create_directory",
                                   .description = "Create a new directory",
                                   .input_schema = path_only_schema("The path of the directory to create")});

  catalog.push_back(ToolDescriptor{.name = "delete_file",
                                   .description = "Delete a file",
                                   .input_schema = path_only_schema("The path to the file to delete")});

  return catalog;
}

}  // namespace

const std::vector<ToolDescriptor>& tool_catalog() {
  static const std::vector<ToolDescriptor> catalog = build_catalog();
  return catalog;
}

nlohmann::json to_json(const ToolDescriptor& descriptor) {
  return nlohmann::json{
      {"name", descriptor.name}, {"description", descriptor.description}, {"inputSchema", descriptor.input_schema}};
}

}  // namespace file_server::tools
