#include "netbackup/cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <sstream>

namespace netbackup {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::Client& client, std::istream& in, std::ostream& out)
  : running_(false)
  , client_(client)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Shell initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(debug) << "CLI: Starting shell loop";
  out_ << "Type 'help' for available commands." << std::endl;
  out_ << "netbackup> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = process_line(line);
    if (running_) {
      out_ << "netbackup> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "CLI: Shell loop ended";
}

bool CLI::process_line(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  std::vector<std::string> args;

  iss >> command;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }

  if (command.empty()) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    out_ << "Goodbye" << std::endl;
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command;

  if (command == "upload") {
    handle_upload_command(args);
  }
  else if (command == "download") {
    handle_download_command(args);
  }
  else if (command == "list" || command == "ls") {
    handle_list_command();
  }
  else if (command == "delete" || command == "rm") {
    handle_delete_command(args);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    out_ << "Unknown command: " << command << ". Type 'help' for available commands." << std::endl;
  }

  // A dropped connection cannot serve further commands
  if (!client_.is_connected()) {
    out_ << "Connection lost" << std::endl;
    return false;
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_upload_command(const std::vector<std::string>& args) {
  if (args.empty() || args.size() > 2) {
    out_ << "Usage: upload <local_file> [remote_name]" << std::endl;
    return;
  }

  std::string remote = args.size() == 2 ? args[1] : std::filesystem::path(args[0]).filename().string();
  try {
    client_.upload(args[0], remote, [this](uint32_t done, uint32_t total) {
      print_progress(out_, done, total);
    });
    out_ << std::endl << "Uploaded " << args[0] << " as " << remote << std::endl;
  } catch (const std::exception& e) {
    out_ << std::endl;
    log_and_display_error("Upload failed", e.what());
  }
}

void CLI::handle_download_command(const std::vector<std::string>& args) {
  if (args.empty() || args.size() > 2) {
    out_ << "Usage: download <remote_file> [local_path]" << std::endl;
    return;
  }

  std::string local = args.size() == 2 ? args[1] : args[0];
  try {
    client_.download(args[0], local, [this](uint32_t done, uint32_t total) {
      print_progress(out_, done, total);
    });
    out_ << std::endl << "Downloaded " << args[0] << " to " << local << std::endl;
  } catch (const std::exception& e) {
    out_ << std::endl;
    log_and_display_error("Download failed", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    out_ << format_listing(client_.list());
  } catch (const std::exception& e) {
    log_and_display_error("List failed", e.what());
  }
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    out_ << "Usage: delete <remote_file>" << std::endl;
    return;
  }

  try {
    client_.remove(args[0]);
    out_ << "Deleted " << args[0] << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Delete failed", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  upload <local> [remote]    Upload a local file" << std::endl;
  out_ << "  download <remote> [local]  Download a stored file" << std::endl;
  out_ << "  list                       List stored files" << std::endl;
  out_ << "  delete <remote>            Delete a stored file" << std::endl;
  out_ << "  help                       Display this help message" << std::endl;
  out_ << "  quit, exit                 Leave the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace netbackup
