#pragma once

#include "skyhost/net/http_client.hpp"
#include "skyhost/net/websocket_probe.hpp"
#include "skyhost/process/runner.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace skyhost::cli {

/// External collaborators and streams used by the commands; tests swap them for fakes.
struct CliDependencies {
  std::shared_ptr<process::ICommandRunner> runner;
  std::shared_ptr<net::HttpClient> http;
  std::shared_ptr<net::WebSocketProber> websocket;
  std::istream *in = &std::cin;
  std::ostream *out = &std::cout;
  std::ostream *err = &std::cerr;
  // Replace the global observer with one built from the loaded config.
  bool install_observer = true;
};

[[nodiscard]] CliDependencies default_dependencies();

[[nodiscard]] std::string version_string();

int run_cli(int argc, char **argv);
/// args excludes the program name.
int run_cli(std::vector<std::string> args, const CliDependencies &deps);

} // namespace skyhost::cli
