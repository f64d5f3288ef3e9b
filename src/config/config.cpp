#include "netbackup/config/config.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdlib>
#include <fstream>

namespace netbackup {
namespace config {

namespace pt = boost::property_tree;

//==============================================
// LOADING
//==============================================

Config Config::load() {
  for (const auto& path : search_paths()) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      continue;
    }

    try {
      Config config = load_from_path(path);
      BOOST_LOG_TRIVIAL(info) << "Config: Loaded from " << path.string();
      return config;
    }
    catch (const ConfigError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Config: Skipping " << path.string() << ": " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Config: No config file found, using defaults";
  return Config{};
}

Config Config::load_from_path(const std::filesystem::path& path) {
  pt::ptree tree;
  try {
    pt::read_ini(path.string(), tree);
  }
  catch (const pt::ini_parser_error& e) {
    throw ConfigError("failed to parse " + path.string() + ": " + e.message()
                      + " (line " + std::to_string(e.line()) + ")");
  }

  Config config;
  config.server.bind_address = tree.get<std::string>("server.bind_address", DEFAULT_BIND_ADDRESS);
  config.server.storage_path = tree.get<std::string>("server.storage_path", DEFAULT_STORAGE_PATH);
  config.client.default_server = tree.get<std::string>("client.default_server", DEFAULT_SERVER);
  config.auth.password = tree.get<std::string>("auth.password", DEFAULT_PASSWORD);
  config.logging.level = tree.get<std::string>("logging.level", DEFAULT_LOG_LEVEL);
  config.logging.file = tree.get<std::string>("logging.file", "");
  config.source = path;
  return config;
}

std::vector<std::filesystem::path> Config::search_paths() {
  std::vector<std::filesystem::path> paths;

  // Current directory (highest priority)
  paths.emplace_back("netbackup.ini");

  const char* home = std::getenv("HOME");
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) {
    paths.push_back(std::filesystem::path(xdg) / "netbackup" / "config.ini");
  } else if (home && *home) {
    paths.push_back(std::filesystem::path(home) / ".config" / "netbackup" / "config.ini");
  }

  // Home directory dotfile
  if (home && *home) {
    paths.push_back(std::filesystem::path(home) / ".netbackup.ini");
  }
  return paths;
}


//==============================================
// GENERATION
//==============================================

void Config::generate_default(const std::filesystem::path& path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    throw ConfigError(path.string() + " already exists");
  }

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw ConfigError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  pt::ptree tree;
  tree.put("server.bind_address", DEFAULT_BIND_ADDRESS);
  tree.put("server.storage_path", DEFAULT_STORAGE_PATH);
  tree.put("client.default_server", DEFAULT_SERVER);
  tree.put("auth.password", DEFAULT_PASSWORD);
  tree.put("logging.level", DEFAULT_LOG_LEVEL);
  tree.put("logging.file", "");

  try {
    pt::write_ini(path.string(), tree);
  }
  catch (const pt::ini_parser_error& e) {
    throw ConfigError("failed to write " + path.string() + ": " + e.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Config: Generated default config at " << path.string();
}


//==============================================
// ENDPOINTS
//==============================================

Endpoint parse_endpoint(const std::string& address) {
  std::size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw ConfigError("expected host:port, got '" + address + "'");
  }

  Endpoint endpoint;
  endpoint.host = address.substr(0, colon);
  if (endpoint.host.size() >= 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']') {
    endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
  }
  if (endpoint.host.empty()) {
    throw ConfigError("empty host in '" + address + "'");
  }

  std::string port = address.substr(colon + 1);
  if (port.size() > 5 || port.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError("invalid port in '" + address + "'");
  }
  unsigned long value = std::stoul(port);
  if (value > 65535) {
    throw ConfigError("port out of range in '" + address + "'");
  }
  endpoint.port = static_cast<uint16_t>(value);
  return endpoint;
}

} // namespace config
} // namespace netbackup
