#ifndef NETBACKUP_CONFIG_CONFIG_HPP
#define NETBACKUP_CONFIG_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace netbackup {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

// ---- DEFAULTS ----
constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0:8080";
constexpr const char* DEFAULT_STORAGE_PATH = "./storage_data";
constexpr const char* DEFAULT_SERVER = "127.0.0.1:8080";
constexpr const char* DEFAULT_PASSWORD = "secure_password_123";
constexpr const char* DEFAULT_LOG_LEVEL = "info";

struct ServerConfig {
  std::string bind_address = DEFAULT_BIND_ADDRESS;
  std::string storage_path = DEFAULT_STORAGE_PATH;
};

struct ClientConfig {
  std::string default_server = DEFAULT_SERVER;
};

struct AuthConfig {
  std::string password = DEFAULT_PASSWORD;
};

struct LoggingConfig {
  std::string level = DEFAULT_LOG_LEVEL;
  // Empty for console only
  std::string file;
};

struct Config {
  ServerConfig server;
  ClientConfig client;
  AuthConfig auth;
  LoggingConfig logging;

  // File the values came from, empty when running on defaults
  std::filesystem::path source;


  // ---- LOADING ----
  // First readable file from search_paths(), defaults if none parses
  static Config load();
  // Throws ConfigError if path cannot be read or parsed
  static Config load_from_path(const std::filesystem::path& path);
  // Candidate files in priority order
  static std::vector<std::filesystem::path> search_paths();


  // ---- GENERATION ----
  // Writes the defaults as INI, throws ConfigError if path already exists
  static void generate_default(const std::filesystem::path& path);
};

struct Endpoint {
  std::string host;
  uint16_t port = 0;
};

// Splits "host:port", "[v6addr]:port" is also accepted
Endpoint parse_endpoint(const std::string& address);

} // namespace config
} // namespace netbackup

#endif // NETBACKUP_CONFIG_CONFIG_HPP
