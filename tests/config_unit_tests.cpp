#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

#include "core/config.hpp"

using file_server::core::ServerConfig;
using file_server::core::apply_env_overrides;
using file_server::core::load_server_config;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const std::string& name, const std::string& body) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("file_server_config_" + std::to_string(::getpid()) + "_" + name + ".yaml");
  std::ofstream out(path);
  out << body;
  return path;
}

bool load_throws(const std::filesystem::path& path) {
  bool threw = false;
  try {
    (void)load_server_config(path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return threw;
}

int test_config_parses_nested_keys() {
  const auto path = write_config("full",
                                 "# sandbox\n"
                                 "root: /srv/files   # jail\n"
                                 "server:\n"
                                 "  name: \"docs-server\"\n"
                                 "  version: 2.1.0\n"
                                 "log:\n"
                                 "  requests: yes\n"
                                 "unknown: ignored\n");
  const auto config = load_server_config(path.string());
  std::error_code ec;
  std::filesystem::remove(path, ec);

  if (config.root != "/srv/files") {
    return fail("test_config_parses_nested_keys", "root not parsed");
  }
  if (config.server.name != "docs-server" || config.server.version != "2.1.0") {
    return fail("test_config_parses_nested_keys", "server identity not parsed");
  }
  if (!config.log_requests) {
    return fail("test_config_parses_nested_keys", "log.requests not parsed");
  }
  return 0;
}

int test_config_defaults() {
  const auto path = write_config("empty", "# nothing configured\n");
  const auto config = load_server_config(path.string());
  std::error_code ec;
  std::filesystem::remove(path, ec);

  const ServerConfig defaults{};
  if (config.root != "." || config.server.name != "file-server" || config.server.version != "1.0.0" ||
      config.log_requests != defaults.log_requests) {
    return fail("test_config_defaults", "defaults were not preserved");
  }
  return 0;
}

int test_config_rejects_invalid_values() {
  if (!load_throws(std::filesystem::temp_directory_path() / "file_server_config_does_not_exist.yaml")) {
    return fail("test_config_rejects_invalid_values", "expected a missing file to be rejected");
  }
  if (!load_throws(write_config("empty_root", "root: \"\"\n"))) {
    return fail("test_config_rejects_invalid_values", "expected an empty root to be rejected");
  }
  if (!load_throws(write_config("empty_name", "server:\n  name: ''\n"))) {
    return fail("test_config_rejects_invalid_values", "expected an empty server.name to be rejected");
  }
  if (!load_throws(write_config("bad_bool", "log:\n  requests: sometimes\n"))) {
    return fail("test_config_rejects_invalid_values", "expected a non-boolean log.requests to be rejected");
  }
  if (!load_throws(write_config("over_indented", "    log:\n      requests: true\n"))) {
    return fail("test_config_rejects_invalid_values", "expected a section indented past its parent to be rejected");
  }
  if (!load_throws(write_config("skipped_level", "server:\n      name: deep\n"))) {
    return fail("test_config_rejects_invalid_values", "expected a key indented two levels deeper to be rejected");
  }
  return 0;
}

int test_env_overrides_take_precedence() {
  ServerConfig config{};
  config.root = "/from/file";

  ::setenv("FILE_SERVER_ROOT", "/from/env", 1);
  ::setenv("FILE_SERVER_LOG_REQUESTS", "on", 1);
  apply_env_overrides(config);
  ::unsetenv("FILE_SERVER_ROOT");
  ::unsetenv("FILE_SERVER_LOG_REQUESTS");

  if (config.root != "/from/env" || !config.log_requests) {
    return fail("test_env_overrides_take_precedence", "environment did not override the file");
  }

  ServerConfig untouched{};
  apply_env_overrides(untouched);
  if (untouched.root != "." || untouched.log_requests) {
    return fail("test_env_overrides_take_precedence", "unset variables must leave the config alone");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_parses_nested_keys(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_defaults(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_rejects_invalid_values(); rc != 0) {
    return rc;
  }
  if (int rc = test_env_overrides_take_precedence(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] config unit tests\n";
  return 0;
}
