#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "mcp/session.hpp"
#include "sandbox/path_resolver.hpp"
#include "tools/dispatcher.hpp"

std::string format_config_settings(const file_server::core::ServerConfig& config, const std::string& root,
                                   const std::string& config_path) {
  std::ostringstream output;
  output << "[file-server] " << (config_path.empty() ? "using default config" : "loaded config from " + config_path)
         << " | root=" << root << " | server=" << config.server.name << ' ' << config.server.version
         << " | log_requests=" << (config.log_requests ? "true" : "false");
  return output.str();
}

int main(int argc, char** argv) {
  // A client that goes away must surface as a write error, not kill the process.
  std::signal(SIGPIPE, SIG_IGN);

  const std::string config_path = argc > 1 ? argv[1] : "";

  file_server::core::ServerConfig config{};
  try {
    if (!config_path.empty()) {
      config = file_server::core::load_server_config(config_path);
    }
    file_server::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  try {
    const file_server::sandbox::PathResolver resolver{config.root};
    std::cerr << format_config_settings(config, resolver.root().string(), config_path) << '\n';

    const file_server::tools::Dispatcher dispatcher{resolver};
    file_server::mcp::Session session{file_server::mcp::SessionOptions{.server_name = config.server.name,
                                                                       .server_version = config.server.version,
                                                                       .log_requests = config.log_requests},
                                      dispatcher};
    return session.run(std::cin, std::cout, std::cerr);
  } catch (const std::exception& ex) {
    std::cerr << "startup error: " << ex.what() << '\n';
    return 1;
  }
}
