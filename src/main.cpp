#include "skyhost/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // A peer reset must fail the check, not terminate the process.
  std::signal(SIGPIPE, SIG_IGN);
  return skyhost::cli::run_cli(argc, argv);
}
