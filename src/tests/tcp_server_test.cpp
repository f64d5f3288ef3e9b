#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include "netbackup/client/client.hpp"
#include "netbackup/crypto/integrity.hpp"
#include "netbackup/network/tcp_server.hpp"
#include "test_utils.hpp"

using namespace netbackup;
using client::Client;
using client::ClientError;
using ::testing::_;
using ::testing::InSequence;
using ::testing::MockFunction;

class TcpServerTest : public ::testing::Test {
protected:
  const std::string password = "secure_password_123";
  std::filesystem::path test_dir;
  std::filesystem::path local_dir;
  std::unique_ptr<store::Store> store;
  std::unique_ptr<network::TCP_Server> server;

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    test_dir = make_test_dir("tcp_server_test");
    local_dir = test_dir / "local";
    std::filesystem::create_directories(local_dir);

    store = std::make_unique<store::Store>((test_dir / "storage").string());
    server = std::make_unique<network::TCP_Server>("127.0.0.1", 0, *store, crypto::derive_token(password));
    ASSERT_TRUE(server->start_listener());
    ASSERT_NE(server->get_port(), 0);
  }

  void TearDown() override {
    server->shutdown();
    server.reset();
    store.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  std::unique_ptr<Client> connect_client(const std::string& pw) {
    auto client = std::make_unique<Client>(pw);
    client->connect("127.0.0.1", server->get_port());
    return client;
  }

  std::filesystem::path write_local(const std::string& name, const std::vector<uint8_t>& data) {
    std::filesystem::path path = local_dir / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
  }

  static std::vector<uint8_t> read_local(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

  // Polls until condition holds or the timeout passes
  template <typename Predicate>
  static bool wait_for(Predicate condition, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
  }
};

TEST_F(TcpServerTest, BindsEphemeralPort) {
  EXPECT_TRUE(server->is_running());
  EXPECT_EQ(server->get_address(), "127.0.0.1");

  // Starting twice is refused
  EXPECT_FALSE(server->start_listener());
}

TEST_F(TcpServerTest, AuthenticateWithCorrectPassword) {
  auto client = connect_client(password);
  EXPECT_NO_THROW(client->authenticate());
  EXPECT_TRUE(wait_for([this]() { return server->active_sessions() == 1; }));
}

TEST_F(TcpServerTest, WrongPasswordIsPermissionDenied) {
  auto client = connect_client("wrong_password");
  try {
    client->authenticate();
    FAIL() << "Authentication should have failed";
  } catch (const ClientError& e) {
    ASSERT_TRUE(e.status().has_value());
    EXPECT_EQ(*e.status(), protocol::StatusCode::PERMISSION_DENIED);
  }

  // The connection stays usable after an error response
  EXPECT_TRUE(client->is_connected());
  EXPECT_THROW(client->list(), ClientError);
}

TEST_F(TcpServerTest, UploadListDownloadDelete) {
  std::vector<uint8_t> data = make_test_data(150000);
  std::filesystem::path source = write_local("big.bin", data);
  auto client = connect_client(password);
  client->authenticate();

  MockFunction<void(uint32_t, uint32_t)> progress;
  {
    InSequence sequence;
    EXPECT_CALL(progress, Call(1u, 3u));
    EXPECT_CALL(progress, Call(2u, 3u));
    EXPECT_CALL(progress, Call(3u, 3u));
  }
  client->upload(source.string(), "big.bin", progress.AsStdFunction());

  std::vector<store::FileMetadata> files = client->list();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].filename, "big.bin");
  EXPECT_EQ(files[0].size, 150000u);
  EXPECT_EQ(files[0].checksum, crypto::checksum(data));

  MockFunction<void(uint32_t, uint32_t)> download_progress;
  EXPECT_CALL(download_progress, Call(_, 3u)).Times(3);

  std::filesystem::path target = local_dir / "downloaded.bin";
  client->download("big.bin", target.string(), download_progress.AsStdFunction());
  EXPECT_EQ(read_local(target), data);
  EXPECT_FALSE(std::filesystem::exists(local_dir / "downloaded.bin.part"));

  client->remove("big.bin");
  EXPECT_TRUE(client->list().empty());
  EXPECT_FALSE(store->has("big.bin"));

  try {
    client->retrieve("big.bin");
    FAIL() << "Retrieve after delete should have failed";
  } catch (const ClientError& e) {
    ASSERT_TRUE(e.status().has_value());
    EXPECT_EQ(*e.status(), protocol::StatusCode::NOT_FOUND);
  }
}

TEST_F(TcpServerTest, EmptyFileRoundTrip) {
  std::filesystem::path source = write_local("empty", {});
  auto client = connect_client(password);

  client->upload(source.string(), "empty");
  std::filesystem::path target = local_dir / "empty.out";
  client->download("empty", target.string());
  EXPECT_TRUE(std::filesystem::exists(target));
  EXPECT_EQ(std::filesystem::file_size(target), 0u);
}

TEST_F(TcpServerTest, DownloadMissingFileLeavesNoPartialFile) {
  auto client = connect_client(password);
  std::filesystem::path target = local_dir / "missing.bin";

  try {
    client->download("missing.bin", target.string());
    FAIL() << "Download should have failed";
  } catch (const ClientError& e) {
    ASSERT_TRUE(e.status().has_value());
    EXPECT_EQ(*e.status(), protocol::StatusCode::NOT_FOUND);
  }
  EXPECT_FALSE(std::filesystem::exists(target));
  EXPECT_FALSE(std::filesystem::exists(local_dir / "missing.bin.part"));
}

TEST_F(TcpServerTest, LegacySingleMessageOperations) {
  auto client = connect_client(password);
  std::vector<uint8_t> data = make_test_data(4000);

  client->store("small.txt", data);
  EXPECT_EQ(client->retrieve("small.txt"), data);

  EXPECT_THROW(client->store("too_big", std::vector<uint8_t>(protocol::CHUNK_SIZE + 1)), ClientError);
}

TEST_F(TcpServerTest, ConcurrentUploadsToSameName) {
  constexpr int num_clients = 4;
  std::vector<std::vector<uint8_t>> contents;
  std::vector<std::filesystem::path> sources;
  for (int i = 0; i < num_clients; ++i) {
    contents.push_back(make_test_data(3 * protocol::CHUNK_SIZE + 100, static_cast<uint32_t>(i + 7)));
    sources.push_back(write_local("source_" + std::to_string(i), contents.back()));
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < num_clients; ++i) {
    threads.emplace_back([&, i]() {
      try {
        auto client = connect_client(password);
        client->upload(sources[i].string(), "shared.bin");
      } catch (const std::exception&) {
        failures++;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(failures, 0);

  // Each session buffers its own upload, so the result is one whole file
  std::vector<uint8_t> result = store->get("shared.bin").data;
  bool matches_one = false;
  for (const auto& content : contents) {
    matches_one = matches_one || result == content;
  }
  EXPECT_TRUE(matches_one);
}

TEST_F(TcpServerTest, DisconnectDiscardsIncompleteUpload) {
  {
    auto client = connect_client(password);
    protocol::ChunkPayload first{"abandoned", 0, 2, {1, 2, 3}};
    client->request(protocol::OpCode::STORE_CHUNK, protocol::encode_chunk(first));
  }

  EXPECT_TRUE(wait_for([this]() { return server->active_sessions() == 0; }));
  EXPECT_FALSE(store->has("abandoned"));

  // A fresh session cannot complete the abandoned upload
  auto client = connect_client(password);
  EXPECT_THROW(client->request(protocol::OpCode::STORE_COMPLETE, protocol::encode_filename("abandoned")),
               ClientError);
}

TEST_F(TcpServerTest, MalformedLengthClosesConnection) {
  boost::asio::io_context io_context;
  boost::asio::ip::tcp::socket socket(io_context);
  socket.connect({boost::asio::ip::make_address("127.0.0.1"), server->get_port()});

  // Declared length shorter than a header
  std::vector<uint8_t> prefix = {0x00, 0x00, 0x00, 0x0A};
  boost::asio::write(socket, boost::asio::buffer(prefix));

  std::array<uint8_t, 16> buffer;
  boost::system::error_code ec;
  socket.read_some(boost::asio::buffer(buffer), ec);
  EXPECT_TRUE(ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset)
    << "Unexpected result: " << ec.message();

  // Other clients are unaffected
  auto client = connect_client(password);
  EXPECT_NO_THROW(client->authenticate());
}

TEST_F(TcpServerTest, RestartAfterShutdown) {
  auto client = connect_client(password);
  client->authenticate();

  server->shutdown();
  EXPECT_FALSE(server->is_running());
  EXPECT_EQ(server->active_sessions(), 0u);
  EXPECT_THROW(client->list(), ClientError);

  ASSERT_TRUE(server->start_listener());
  auto second = connect_client(password);
  EXPECT_NO_THROW(second->authenticate());
}

TEST_F(TcpServerTest, ManySequentialConnections) {
  for (int i = 0; i < 20; ++i) {
    auto client = connect_client(password);
    client->store("file_" + std::to_string(i), {static_cast<uint8_t>(i)});
  }
  EXPECT_EQ(store->list().size(), 20u);
}

TEST_F(TcpServerTest, ShutdownWhileClientsDisconnect) {
  std::vector<std::unique_ptr<Client>> clients;
  for (int i = 0; i < 8; ++i) {
    clients.push_back(connect_client(password));
    clients.back()->authenticate();
  }
  ASSERT_TRUE(wait_for([this]() { return server->active_sessions() == 8; }));

  // Half the peers hang up while the server tears every session down
  std::thread disconnector([&clients]() {
    for (std::size_t i = 0; i < clients.size(); i += 2) {
      clients[i]->disconnect();
    }
  });
  server->shutdown();
  disconnector.join();

  EXPECT_FALSE(server->is_running());
  EXPECT_EQ(server->active_sessions(), 0u);
  EXPECT_THROW(clients[1]->list(), ClientError);
}
