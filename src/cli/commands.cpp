#include "netbackup/cli/cli.hpp"
#include "netbackup/config/config.hpp"
#include "netbackup/crypto/integrity.hpp"
#include "netbackup/logger/logger.hpp"
#include "netbackup/network/tcp_server.hpp"
#include "netbackup/store/store.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <termios.h>
#include <unistd.h>
#include <algorithm>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <set>
#include <sstream>

namespace netbackup {
namespace cli {

namespace {

// Options each command accepts after its name
const std::map<std::string, std::set<std::string>> COMMAND_OPTIONS = {
  {"server",      {"--bind", "--storage"}},
  {"upload",      {"--server", "--password"}},
  {"download",    {"--server", "--password"}},
  {"list",        {"--server", "--password"}},
  {"delete",      {"--server", "--password"}},
  {"connect",     {"--server", "--password"}},
  {"init-config", {"--output"}},
  {"help",        {}}
};

// Positional argument bounds per command
const std::map<std::string, std::pair<std::size_t, std::size_t>> COMMAND_ARITY = {
  {"server",      {0, 0}},
  {"upload",      {1, 2}},
  {"download",    {1, 2}},
  {"list",        {0, 0}},
  {"delete",      {1, 1}},
  {"connect",     {0, 0}},
  {"init-config", {0, 0}},
  {"help",        {0, 0}}
};

config::Config load_config(const CommandLine& command_line) {
  if (!command_line.config_path.empty()) {
    return config::Config::load_from_path(command_line.config_path);
  }
  return config::Config::load();
}

// Connects and authenticates with flags taking precedence over the config
std::unique_ptr<client::Client> open_client(const CommandLine& command_line, const config::Config& config) {
  config::Endpoint endpoint = config::parse_endpoint(
    command_line.option("--server", config.client.default_server));

  std::string password = command_line.has_option("--password")
    ? command_line.options.at("--password")
    : read_password("Password: ");

  auto client = std::make_unique<client::Client>(password);
  client->connect(endpoint.host, endpoint.port);
  client->authenticate();
  return client;
}

int run_server(const CommandLine& command_line, const config::Config& config) {
  config::Endpoint endpoint = config::parse_endpoint(
    command_line.option("--bind", config.server.bind_address));
  std::string storage_path = command_line.option("--storage", config.server.storage_path);

  store::Store store(storage_path);
  network::TCP_Server server(endpoint.host, endpoint.port, store, crypto::derive_token(config.auth.password));
  if (!server.start_listener()) {
    std::cerr << "Error: Failed to listen on " << endpoint.host << ":" << endpoint.port << std::endl;
    return 1;
  }

  std::cout << "Server listening on " << endpoint.host << ":" << server.get_port()
            << ", storing files in " << storage_path << std::endl;

  // Block until SIGINT or SIGTERM
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "CLI: Received signal " << signal_number << ", shutting down";
    }
    server.shutdown();
  });
  signal_context.run();
  return 0;
}

int run_upload(const CommandLine& command_line, const config::Config& config) {
  const std::string& local = command_line.arguments[0];
  std::string remote = command_line.arguments.size() > 1
    ? command_line.arguments[1]
    : std::filesystem::path(local).filename().string();

  auto client = open_client(command_line, config);
  client->upload(local, remote, [](uint32_t done, uint32_t total) {
    print_progress(std::cout, done, total);
  });
  std::cout << std::endl << "Uploaded " << local << " as " << remote << std::endl;
  return 0;
}

int run_download(const CommandLine& command_line, const config::Config& config) {
  const std::string& remote = command_line.arguments[0];
  std::string local = command_line.arguments.size() > 1 ? command_line.arguments[1] : remote;

  auto client = open_client(command_line, config);
  client->download(remote, local, [](uint32_t done, uint32_t total) {
    print_progress(std::cout, done, total);
  });
  std::cout << std::endl << "Downloaded " << remote << " to " << local << std::endl;
  return 0;
}

int run_list(const CommandLine& command_line, const config::Config& config) {
  auto client = open_client(command_line, config);
  std::cout << format_listing(client->list());
  return 0;
}

int run_delete(const CommandLine& command_line, const config::Config& config) {
  auto client = open_client(command_line, config);
  client->remove(command_line.arguments[0]);
  std::cout << "Deleted " << command_line.arguments[0] << std::endl;
  return 0;
}

int run_connect(const CommandLine& command_line, const config::Config& config) {
  auto client = open_client(command_line, config);
  std::cout << "Connected and authenticated" << std::endl;
  CLI shell(*client);
  shell.run();
  return 0;
}

int run_init_config(const CommandLine& command_line) {
  std::string output = command_line.option("--output", "netbackup.ini");
  config::Config::generate_default(output);
  std::cout << "Wrote default configuration to " << output << std::endl;
  return 0;
}

} // namespace


//==============================================
// COMMAND LINE
//==============================================

std::string CommandLine::option(const std::string& name, const std::string& fallback) const {
  auto it = options.find(name);
  return it == options.end() ? fallback : it->second;
}

CommandLine parse_command_line(int argc, char* argv[]) {
  CommandLine command_line;
  if (argc > 0) {
    command_line.program_name = argv[0];
  }

  int i = 1;
  // Global flags precede the command
  for (; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag == "--config" || flag == "--log-level") {
      if (i + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
      }
      (flag == "--config" ? command_line.config_path : command_line.log_level) = argv[++i];
    } else if (flag == "-h" || flag == "--help") {
      command_line.command = "help";
      return command_line;
    } else if (flag.rfind("--", 0) == 0) {
      throw UsageError("Unknown argument: " + flag);
    } else {
      break;
    }
  }

  if (i >= argc) {
    command_line.command = "help";
    return command_line;
  }

  command_line.command = argv[i++];
  auto allowed = COMMAND_OPTIONS.find(command_line.command);
  if (allowed == COMMAND_OPTIONS.end()) {
    throw UsageError("Unknown command: " + command_line.command);
  }

  for (; i < argc; ++i) {
    const std::string arg(argv[i]);
    if (arg.rfind("--", 0) != 0) {
      command_line.arguments.push_back(arg);
      continue;
    }
    if (allowed->second.count(arg) == 0) {
      throw UsageError("Unknown option for " + command_line.command + ": " + arg);
    }
    if (i + 1 >= argc) {
      throw UsageError("Missing value for " + arg);
    }
    command_line.options[arg] = argv[++i];
  }

  const auto& arity = COMMAND_ARITY.at(command_line.command);
  if (command_line.arguments.size() < arity.first || command_line.arguments.size() > arity.second) {
    throw UsageError("Wrong number of arguments for " + command_line.command);
  }
  return command_line;
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [--config <path>] [--log-level <level>] <command> [args]\n"
      << "Commands:\n"
      << "  server [--bind host:port] [--storage dir]              Run the storage server\n"
      << "  upload <local_file> [remote_name] [--server addr] [--password pw]\n"
      << "  download <remote_file> [local_path] [--server addr] [--password pw]\n"
      << "  list [--server addr] [--password pw]\n"
      << "  delete <remote_file> [--server addr] [--password pw]\n"
      << "  connect [--server addr] [--password pw]                Interactive shell\n"
      << "  init-config [--output path]                            Write a default config file\n"
      << "  help\n"
      << "Log levels: trace, debug, info, warning, error, fatal\n"
      << "Example: " << program_name << " upload report.pdf --server 127.0.0.1:8080\n";
}

int run(const CommandLine& command_line) {
  if (command_line.command == "help") {
    print_usage(std::cout, command_line.program_name);
    return 0;
  }

  try {
    logger::init_logging(command_line.log_level.empty()
                           ? boost::log::trivial::info
                           : logger::parse_severity(command_line.log_level));

    config::Config config = load_config(command_line);
    // The command line level wins over the configured one
    std::string level = command_line.log_level.empty() ? config.logging.level : command_line.log_level;
    logger::init_logging(logger::parse_severity(level), config.logging.file);

    const std::string& command = command_line.command;
    if (command == "server")      return run_server(command_line, config);
    if (command == "upload")      return run_upload(command_line, config);
    if (command == "download")    return run_download(command_line, config);
    if (command == "list")        return run_list(command_line, config);
    if (command == "delete")      return run_delete(command_line, config);
    if (command == "connect")     return run_connect(command_line, config);
    if (command == "init-config") return run_init_config(command_line);

    throw UsageError("Unknown command: " + command);
  }
  catch (const UsageError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(std::cerr, command_line.program_name);
    return 2;
  }
  catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}


//==============================================
// OUTPUT HELPERS
//==============================================

std::string format_listing(const std::vector<store::FileMetadata>& files) {
  std::ostringstream out;
  if (files.empty()) {
    out << "No files stored" << std::endl;
    return out.str();
  }

  std::size_t name_width = 4;
  for (const auto& file : files) {
    name_width = std::max(name_width, file.filename.size());
  }

  out << std::left << std::setw(static_cast<int>(name_width)) << "NAME" << "  "
      << std::right << std::setw(12) << "SIZE" << "  "
      << std::left << std::setw(19) << "MODIFIED (UTC)" << "  SHA256" << std::endl;

  for (const auto& file : files) {
    std::time_t modified = static_cast<std::time_t>(file.modified_time);
    std::tm utc{};
    gmtime_r(&modified, &utc);

    out << std::left << std::setw(static_cast<int>(name_width)) << file.filename << "  "
        << std::right << std::setw(12) << file.size << "  "
        << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << "  "
        << crypto::to_hex(file.checksum).substr(0, 16) << std::endl;
  }
  out << files.size() << (files.size() == 1 ? " file" : " files") << std::endl;
  return out.str();
}

void print_progress(std::ostream& out, uint32_t done, uint32_t total) {
  unsigned percent = total == 0 ? 100 : static_cast<unsigned>(uint64_t{done} * 100 / total);
  out << "\rProgress: " << std::setw(3) << percent << "% (" << done << "/" << total << " chunks)" << std::flush;
}

std::string read_password(const std::string& prompt) {
  std::cerr << prompt << std::flush;

  termios saved{};
  bool is_terminal = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved) == 0;
  if (is_terminal) {
    termios silent = saved;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    ::tcsetattr(STDIN_FILENO, TCSANOW, &silent);
  }

  std::string password;
  std::getline(std::cin, password);

  if (is_terminal) {
    ::tcsetattr(STDIN_FILENO, TCSANOW, &saved);
    std::cerr << std::endl;
  }
  return password;
}

} // namespace cli
} // namespace netbackup
