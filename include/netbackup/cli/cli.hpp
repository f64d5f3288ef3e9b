#pragma once

#include <cstdint>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "netbackup/client/client.hpp"
#include "netbackup/store/file_metadata.hpp"

namespace netbackup {
namespace cli {

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// Parsed `netbackup [global flags] <command> [arguments] [--option value]`
struct CommandLine {
  std::string program_name = "netbackup";
  std::string config_path;
  std::string log_level;
  std::string command;
  std::vector<std::string> arguments;
  std::map<std::string, std::string> options;

  bool has_option(const std::string& name) const { return options.count(name) != 0; }
  std::string option(const std::string& name, const std::string& fallback) const;
};


// ---- COMMAND LINE ----
// Throws UsageError on unknown commands, unknown options or missing values
CommandLine parse_command_line(int argc, char* argv[]);
void print_usage(std::ostream& out, const std::string& program_name);
// Executes the parsed command and returns the process exit code
int run(const CommandLine& command_line);


// ---- OUTPUT HELPERS ----
// Table of name, size, modification time (UTC) and checksum prefix
std::string format_listing(const std::vector<store::FileMetadata>& files);
// Rewrites the current terminal line with a percentage
void print_progress(std::ostream& out, uint32_t done, uint32_t total);
// Prompts on stderr and reads one line with terminal echo disabled
std::string read_password(const std::string& prompt);


// Interactive shell over one authenticated connection
class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(client::Client& client, std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Reads commands until quit, exit or end of input
  void run();
  // Executes one command line, returns false once the shell should stop
  bool process_line(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  // System components
  client::Client& client_;
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void handle_upload_command(const std::vector<std::string>& args);
  void handle_download_command(const std::vector<std::string>& args);
  void handle_list_command();
  void handle_delete_command(const std::vector<std::string>& args);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace netbackup
