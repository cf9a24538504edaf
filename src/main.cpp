#include "runclaw/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // Writes to a child that already exited must fail with EPIPE instead of killing us
  std::signal(SIGPIPE, SIG_IGN);
  return runclaw::cli::run_cli(argc, argv);
}
