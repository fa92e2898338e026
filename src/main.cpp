#include "cli/cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
  const jigsaw::cli::CommandLine command_line = jigsaw::cli::parse_command_line(argc, argv);
  if (!command_line.valid) {
    jigsaw::cli::print_usage(argc > 0 ? argv[0] : "jigsaw", std::cerr);
    return 1;
  }

  jigsaw::cli::CLI cli;
  return cli.run(command_line);
}
