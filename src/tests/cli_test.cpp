#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include "netbackup/cli/cli.hpp"
#include "netbackup/crypto/integrity.hpp"
#include "netbackup/network/tcp_server.hpp"
#include "test_utils.hpp"

using namespace netbackup;
using cli::CommandLine;
using cli::UsageError;

namespace {

// Builds argv from string literals
CommandLine parse(std::vector<std::string> args) {
  args.insert(args.begin(), "netbackup");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return cli::parse_command_line(static_cast<int>(argv.size()), argv.data());
}

} // namespace


//==============================================
// ARGUMENT PARSING
//==============================================

TEST(CommandLineTest, NoArgumentsMeansHelp) {
  EXPECT_EQ(parse({}).command, "help");
  EXPECT_EQ(parse({"--help"}).command, "help");
  EXPECT_EQ(parse({"-h"}).command, "help");
}

TEST(CommandLineTest, GlobalFlagsPrecedeCommand) {
  CommandLine command_line = parse({"--config", "my.ini", "--log-level", "debug", "list"});
  EXPECT_EQ(command_line.config_path, "my.ini");
  EXPECT_EQ(command_line.log_level, "debug");
  EXPECT_EQ(command_line.command, "list");
  EXPECT_TRUE(command_line.arguments.empty());
}

TEST(CommandLineTest, UploadArgumentsAndOptions) {
  CommandLine command_line = parse({"upload", "report.pdf", "--server", "10.0.0.1:9000", "backup.pdf"});
  EXPECT_EQ(command_line.command, "upload");
  ASSERT_EQ(command_line.arguments.size(), 2u);
  EXPECT_EQ(command_line.arguments[0], "report.pdf");
  EXPECT_EQ(command_line.arguments[1], "backup.pdf");
  EXPECT_TRUE(command_line.has_option("--server"));
  EXPECT_EQ(command_line.option("--server", "unused"), "10.0.0.1:9000");
  EXPECT_EQ(command_line.option("--password", "fallback"), "fallback");
}

TEST(CommandLineTest, ServerOptions) {
  CommandLine command_line = parse({"server", "--bind", "127.0.0.1:0", "--storage", "/tmp/data"});
  EXPECT_EQ(command_line.option("--bind", ""), "127.0.0.1:0");
  EXPECT_EQ(command_line.option("--storage", ""), "/tmp/data");
}

TEST(CommandLineTest, RejectsBadInvocations) {
  EXPECT_THROW(parse({"frobnicate"}), UsageError);
  EXPECT_THROW(parse({"upload"}), UsageError);
  EXPECT_THROW(parse({"delete", "a", "b"}), UsageError);
  EXPECT_THROW(parse({"list", "--bind", "x:1"}), UsageError);
  EXPECT_THROW(parse({"upload", "file", "--server"}), UsageError);
  EXPECT_THROW(parse({"--config"}), UsageError);
  EXPECT_THROW(parse({"--verbose", "list"}), UsageError);
}

TEST(CommandLineTest, HelpAndBadLevelExitCodes) {
  EXPECT_EQ(cli::run(parse({"help"})), 0);

  CommandLine bad_level = parse({"--log-level", "chatty", "list"});
  EXPECT_EQ(cli::run(bad_level), 1);
  init_logging();
}

TEST(CommandLineTest, InitConfigWritesOnce) {
  std::filesystem::path dir = make_test_dir("cli_init_config");
  std::string output = (dir / "netbackup.ini").string();

  EXPECT_EQ(cli::run(parse({"--log-level", "error", "init-config", "--output", output})), 0);
  EXPECT_TRUE(std::filesystem::exists(output));
  EXPECT_EQ(cli::run(parse({"--log-level", "error", "init-config", "--output", output})), 1);

  init_logging();
  std::filesystem::remove_all(dir);
}


//==============================================
// OUTPUT HELPERS
//==============================================

TEST(OutputTest, EmptyListing) {
  EXPECT_EQ(cli::format_listing({}), "No files stored\n");
}

TEST(OutputTest, ListingTable) {
  store::FileMetadata file{"report.pdf", 150000, 0, {}};
  file.checksum.fill(0xAB);

  std::string text = cli::format_listing({file});
  EXPECT_NE(text.find("NAME"), std::string::npos);
  EXPECT_NE(text.find("report.pdf"), std::string::npos);
  EXPECT_NE(text.find("150000"), std::string::npos);
  EXPECT_NE(text.find("1970-01-01 00:00:00"), std::string::npos);
  EXPECT_NE(text.find("abababababababab"), std::string::npos);
  EXPECT_EQ(text.find("abababababababababab"), std::string::npos);
  EXPECT_NE(text.find("1 file\n"), std::string::npos);
}

TEST(OutputTest, Progress) {
  std::ostringstream out;
  cli::print_progress(out, 1, 3);
  EXPECT_EQ(out.str(), "\rProgress:  33% (1/3 chunks)");

  out.str("");
  cli::print_progress(out, 3, 3);
  EXPECT_EQ(out.str(), "\rProgress: 100% (3/3 chunks)");
}


//==============================================
// INTERACTIVE SHELL
//==============================================

class ShellTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<store::Store> store;
  std::unique_ptr<network::TCP_Server> server;
  std::unique_ptr<client::Client> client;

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    test_dir = make_test_dir("shell_test");
    store = std::make_unique<store::Store>((test_dir / "storage").string());
    server = std::make_unique<network::TCP_Server>("127.0.0.1", 0, *store, crypto::derive_token("pw"));
    ASSERT_TRUE(server->start_listener());

    client = std::make_unique<client::Client>("pw");
    client->connect("127.0.0.1", server->get_port());
    client->authenticate();
  }

  void TearDown() override {
    client.reset();
    server->shutdown();
    server.reset();
    store.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }
};

TEST_F(ShellTest, UploadListDeleteSession) {
  std::filesystem::path local = test_dir / "notes.txt";
  {
    std::ofstream file(local);
    file << "some notes";
  }

  std::istringstream in(
    "upload " + local.string() + "\n"
    "list\n"
    "bogus\n"
    "delete notes.txt\n"
    "delete notes.txt\n"
    "quit\n"
    "list\n");
  std::ostringstream out;

  cli::CLI shell(*client, in, out);
  shell.run();

  std::string text = out.str();
  EXPECT_NE(text.find("Uploaded " + local.string() + " as notes.txt"), std::string::npos);
  EXPECT_NE(text.find("1 file"), std::string::npos);
  EXPECT_NE(text.find("Unknown command: bogus"), std::string::npos);
  EXPECT_NE(text.find("Deleted notes.txt"), std::string::npos);
  EXPECT_NE(text.find("Delete failed: Not found: File not found: notes.txt"), std::string::npos);
  EXPECT_NE(text.find("Goodbye"), std::string::npos);
  EXPECT_FALSE(store->has("notes.txt"));
}

TEST_F(ShellTest, UsageMessagesAndBlankLines) {
  cli::CLI shell(*client, std::cin, std::cout);
  EXPECT_TRUE(shell.process_line(""));
  EXPECT_TRUE(shell.process_line("   "));
  EXPECT_TRUE(shell.process_line("upload"));
  EXPECT_TRUE(shell.process_line("download a b c"));
  EXPECT_FALSE(shell.process_line("exit"));
}

TEST_F(ShellTest, LostConnectionEndsShell) {
  std::ostringstream out;
  std::istringstream in;
  cli::CLI shell(*client, in, out);

  server->shutdown();
  EXPECT_FALSE(shell.process_line("list"));
  EXPECT_NE(out.str().find("Connection lost"), std::string::npos);
}
