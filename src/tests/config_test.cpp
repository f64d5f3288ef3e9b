#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "netbackup/config/config.hpp"
#include "test_utils.hpp"

using namespace netbackup::config;

class ConfigTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    test_dir = make_test_dir("config_test");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  std::filesystem::path write_file(const std::string& name, const std::string& content) {
    std::filesystem::path path = test_dir / name;
    std::ofstream file(path);
    file << content;
    return path;
  }
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
  Config config;
  EXPECT_EQ(config.server.bind_address, "0.0.0.0:8080");
  EXPECT_EQ(config.server.storage_path, "./storage_data");
  EXPECT_EQ(config.client.default_server, "127.0.0.1:8080");
  EXPECT_EQ(config.auth.password, "secure_password_123");
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.logging.file.empty());
  EXPECT_TRUE(config.source.empty());
}

TEST_F(ConfigTest, LoadsAllSections) {
  auto path = write_file("full.ini",
    "[server]\n"
    "bind_address = 127.0.0.1:9000\n"
    "storage_path = /var/lib/netbackup\n"
    "[client]\n"
    "default_server = backup.example:9000\n"
    "[auth]\n"
    "password = hunter2\n"
    "[logging]\n"
    "level = debug\n"
    "file = /tmp/netbackup.log\n");

  Config config = Config::load_from_path(path);
  EXPECT_EQ(config.server.bind_address, "127.0.0.1:9000");
  EXPECT_EQ(config.server.storage_path, "/var/lib/netbackup");
  EXPECT_EQ(config.client.default_server, "backup.example:9000");
  EXPECT_EQ(config.auth.password, "hunter2");
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.file, "/tmp/netbackup.log");
  EXPECT_EQ(config.source, path);
}

TEST_F(ConfigTest, MissingKeysFallBackToDefaults) {
  auto path = write_file("partial.ini",
    "[auth]\n"
    "password = only_this\n");

  Config config = Config::load_from_path(path);
  EXPECT_EQ(config.auth.password, "only_this");
  EXPECT_EQ(config.server.bind_address, DEFAULT_BIND_ADDRESS);
  EXPECT_EQ(config.client.default_server, DEFAULT_SERVER);
  EXPECT_EQ(config.logging.level, DEFAULT_LOG_LEVEL);
}

TEST_F(ConfigTest, MalformedFileIsConfigError) {
  auto path = write_file("broken.ini", "[server\nbind_address = x\n");
  EXPECT_THROW(Config::load_from_path(path), ConfigError);
  EXPECT_THROW(Config::load_from_path(test_dir / "missing.ini"), ConfigError);
}

TEST_F(ConfigTest, GenerateDefaultThenLoad) {
  std::filesystem::path path = test_dir / "nested" / "netbackup.ini";
  ASSERT_NO_THROW(Config::generate_default(path));
  ASSERT_TRUE(std::filesystem::exists(path));

  Config config = Config::load_from_path(path);
  EXPECT_EQ(config.server.bind_address, DEFAULT_BIND_ADDRESS);
  EXPECT_EQ(config.server.storage_path, DEFAULT_STORAGE_PATH);
  EXPECT_EQ(config.auth.password, DEFAULT_PASSWORD);
  EXPECT_TRUE(config.logging.file.empty());
}

TEST_F(ConfigTest, GenerateDefaultRefusesOverwrite) {
  auto path = write_file("existing.ini", "[auth]\npassword = keep_me\n");
  EXPECT_THROW(Config::generate_default(path), ConfigError);
  EXPECT_EQ(Config::load_from_path(path).auth.password, "keep_me");
}

TEST_F(ConfigTest, SearchPathsFollowEnvironment) {
  std::string old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
  std::string old_xdg = std::getenv("XDG_CONFIG_HOME") ? std::getenv("XDG_CONFIG_HOME") : "";

  ::setenv("HOME", "/home/tester", 1);
  ::setenv("XDG_CONFIG_HOME", "/xdg", 1);
  auto paths = Config::search_paths();
  ASSERT_EQ(paths.size(), 3u);
  EXPECT_EQ(paths[0], std::filesystem::path("netbackup.ini"));
  EXPECT_EQ(paths[1], std::filesystem::path("/xdg/netbackup/config.ini"));
  EXPECT_EQ(paths[2], std::filesystem::path("/home/tester/.netbackup.ini"));

  ::unsetenv("XDG_CONFIG_HOME");
  paths = Config::search_paths();
  ASSERT_EQ(paths.size(), 3u);
  EXPECT_EQ(paths[1], std::filesystem::path("/home/tester/.config/netbackup/config.ini"));

  ::setenv("HOME", old_home.c_str(), 1);
  if (!old_xdg.empty()) {
    ::setenv("XDG_CONFIG_HOME", old_xdg.c_str(), 1);
  }
}

TEST_F(ConfigTest, ParseEndpoint) {
  Endpoint endpoint = parse_endpoint("127.0.0.1:8080");
  EXPECT_EQ(endpoint.host, "127.0.0.1");
  EXPECT_EQ(endpoint.port, 8080);

  endpoint = parse_endpoint("[::1]:9000");
  EXPECT_EQ(endpoint.host, "::1");
  EXPECT_EQ(endpoint.port, 9000);

  endpoint = parse_endpoint("localhost:0");
  EXPECT_EQ(endpoint.port, 0);
}

TEST_F(ConfigTest, ParseEndpointRejectsGarbage) {
  EXPECT_THROW(parse_endpoint("localhost"), ConfigError);
  EXPECT_THROW(parse_endpoint(":8080"), ConfigError);
  EXPECT_THROW(parse_endpoint("host:"), ConfigError);
  EXPECT_THROW(parse_endpoint("host:http"), ConfigError);
  EXPECT_THROW(parse_endpoint("host:65536"), ConfigError);
  EXPECT_THROW(parse_endpoint("host:-1"), ConfigError);
  EXPECT_THROW(parse_endpoint("[]:80"), ConfigError);
}
