#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace file_server::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end =
      std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error("expected a boolean value, got: " + value);
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == "root") {
    if (value.empty()) {
      throw std::runtime_error("root must not be empty");
    }
    config.root = value;
    return;
  }

  if (key == "server.name") {
    if (value.empty()) {
      throw std::runtime_error("server.name must not be empty");
    }
    config.server.name = value;
    return;
  }

  if (key == "server.version") {
    config.server.version = value;
    return;
  }

  if (key == "log.requests") {
    config.log_requests = parse_bool(value);
  }
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }
    if (depth > sections.size()) {
      throw std::runtime_error("unexpected indentation at line " + std::to_string(line_number) + " of " + path);
    }

    if (trim(stripped.substr(colon_pos + 1)).empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_env_overrides(ServerConfig& config) {
  if (const auto* root = std::getenv("FILE_SERVER_ROOT"); root != nullptr && *root != '\0') {
    config.root = root;
  }
  if (const auto* log_requests = std::getenv("FILE_SERVER_LOG_REQUESTS"); log_requests != nullptr) {
    config.log_requests = parse_bool(log_requests);
  }
}

}  // namespace file_server::core
