#include "netbackup/cli/cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
  netbackup::cli::CommandLine command_line;
  try {
    command_line = netbackup::cli::parse_command_line(argc, argv);
  } catch (const netbackup::cli::UsageError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    netbackup::cli::print_usage(std::cerr, argc > 0 ? argv[0] : "netbackup");
    return 2;
  }
  return netbackup::cli::run(command_line);
}
