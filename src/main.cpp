#include "docsandbox/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // The renderer feeds markup through a pipe; a renderer that exits early
  // must surface as a write error, not kill the process.
  std::signal(SIGPIPE, SIG_IGN);
  return docsandbox::cli::run_cli(argc, argv);
}
