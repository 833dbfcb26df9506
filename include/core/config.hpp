#pragma once

#include <string>

namespace file_server::core {

struct ServerIdentity {
  std::string name{"file-server"};
  std::string version{"1.0.0"};
};

struct ServerConfig {
  std::string root{"."};
  ServerIdentity server{};
  bool log_requests{false};
};

ServerConfig load_server_config(const std::string& path);

// FILE_SERVER_ROOT and FILE_SERVER_LOG_REQUESTS take precedence over the file.
void apply_env_overrides(ServerConfig& config);

}  // namespace file_server::core
