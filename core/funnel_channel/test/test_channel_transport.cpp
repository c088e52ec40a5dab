// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Tests for the Unix-socket carrier: ChannelServer and ChannelClient
 */

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "channel_client.hpp"
#include "channel_handle.hpp"
#include "channel_server.hpp"
#include "funnel_errors.hpp"
#include "record_channel.hpp"
#include "record_codec.hpp"
#include "test_helpers.hpp"

using namespace funnel;
using namespace funnel::channel;
using funnel::logging::severity_level;
using funnel::test::make_test_record;
using funnel::test::TempDirectory;
using funnel::test::wait_for;

namespace fs = boost::filesystem;

class ChannelTransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::make_unique<TempDirectory>();
    handle_ = RecordChannelHandle::generate(dir_->string());
    channel_ = std::make_unique<RecordChannel>();
    server_ = std::make_unique<ChannelServer>(*channel_, handle_);
    server_->start();
  }

  void TearDown() override {
    server_.reset();
    channel_.reset();
    dir_.reset();
  }

  std::vector<record::LogRecord> drain(size_t expected) {
    std::vector<record::LogRecord> received;
    while (received.size() < expected) {
      auto rec = channel_->receive_for(std::chrono::milliseconds(2000));
      if (!rec) {
        break;
      }
      received.push_back(std::move(*rec));
    }
    return received;
  }

  std::unique_ptr<TempDirectory> dir_;
  RecordChannelHandle handle_;
  std::unique_ptr<RecordChannel> channel_;
  std::unique_ptr<ChannelServer> server_;
};

TEST_F(ChannelTransportTest, ServerCreatesSocketFile) {
  EXPECT_TRUE(server_->is_running());
  EXPECT_EQ(fs::status(handle_.socket_path()).type(), fs::socket_file);
}

TEST_F(ChannelTransportTest, ClientRecordsReachChannel) {
  ChannelClient client(handle_);
  auto rec = make_test_record("worker.job", "from worker", severity_level::error);
  rec.location = record::SourceLocation{"/src/job.cpp", 8, "execute"};

  ASSERT_EQ(client.send(rec), ChannelStatus::ok);
  ASSERT_TRUE(client.flush());

  auto received = drain(1);
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0], rec);
  EXPECT_TRUE(wait_for([this]() {
    return server_->stats().records_received == 1;
  }));
}

TEST_F(ChannelTransportTest, NonUtf8MessageArrivesUnchanged) {
  ChannelClient client(handle_);
  const std::string raw("latin1 caf\xE9 \x80\xFF", 14);
  auto rec = make_test_record("worker.\xE9", raw);

  ASSERT_EQ(client.send(rec), ChannelStatus::ok);
  ASSERT_TRUE(client.flush());

  auto received = drain(1);
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].message, raw);
  EXPECT_EQ(received[0], rec);
}

TEST_F(ChannelTransportTest, OrderPreservedPerClient) {
  const int kClients = 3;
  const int kPerClient = 200;

  std::vector<std::thread> workers;
  for (int c = 0; c < kClients; ++c) {
    workers.emplace_back([this, c]() {
      ChannelClient client(handle_);
      for (int i = 0; i < kPerClient; ++i) {
        client.send(make_test_record("w" + std::to_string(c), std::to_string(i)));
      }
      client.close();
    });
  }
  for (auto& t : workers) {
    t.join();
  }

  auto received = drain(kClients * kPerClient);
  ASSERT_EQ(received.size(), static_cast<size_t>(kClients * kPerClient));

  std::map<std::string, int> last_seen;
  for (const auto& rec : received) {
    int index = std::stoi(rec.message);
    auto it = last_seen.find(rec.channel);
    if (it != last_seen.end()) {
      EXPECT_EQ(index, it->second + 1) << "gap or reorder in " << rec.channel;
    } else {
      EXPECT_EQ(index, 0);
    }
    last_seen[rec.channel] = index;
  }
  EXPECT_EQ(server_->stats().connections_accepted, static_cast<uint64_t>(kClients));
}

TEST_F(ChannelTransportTest, ClosedClientRejectsSends) {
  ChannelClient client(handle_);
  client.close();
  EXPECT_TRUE(client.is_closed());
  EXPECT_EQ(client.send(make_test_record("app", "late")), ChannelStatus::closed);
  client.close();
}

TEST_F(ChannelTransportTest, StopWaitsForConnectedClients) {
  auto client = std::make_unique<ChannelClient>(handle_);
  client->send(make_test_record("app", "before stop"));
  ASSERT_TRUE(client->flush());
  ASSERT_TRUE(wait_for([this]() {
    return server_->active_sessions() == 1;
  }));

  std::thread closer([&client]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    client->close();
  });
  server_->stop(std::chrono::milliseconds(3000));
  closer.join();

  EXPECT_FALSE(server_->is_running());
  EXPECT_EQ(server_->active_sessions(), 0u);
  EXPECT_FALSE(fs::exists(handle_.socket_path()));
  EXPECT_EQ(drain(1).size(), 1u);
}

TEST_F(ChannelTransportTest, StopClosesLingeringSessionsAfterTimeout) {
  ChannelClient client(handle_);
  ASSERT_TRUE(wait_for([this]() {
    return server_->active_sessions() == 1;
  }));

  server_->stop(std::chrono::milliseconds(50));
  EXPECT_EQ(server_->active_sessions(), 0u);
  server_->stop();
}

TEST_F(ChannelTransportTest, ClientNoticesVanishedOwner) {
  ChannelClient client(handle_);
  server_->stop();

  // The first writes may still land in the kernel buffer
  EXPECT_TRUE(wait_for([&client]() {
    client.send(make_test_record("app", "into the void"));
    return client.is_closed();
  }));
  EXPECT_EQ(client.send(make_test_record("app", "late")), ChannelStatus::closed);
}

TEST_F(ChannelTransportTest, MalformedPayloadIsSkipped) {
  boost::asio::io_context io;
  boost::asio::local::stream_protocol::socket raw(io);
  raw.connect(boost::asio::local::stream_protocol::endpoint(handle_.socket_path()));

  std::string bad_payload = "{\"channel\": \"app\"}";
  std::string bad_frame;
  uint32_t len = static_cast<uint32_t>(bad_payload.size());
  bad_frame.push_back(static_cast<char>((len >> 24) & 0xFF));
  bad_frame.push_back(static_cast<char>((len >> 16) & 0xFF));
  bad_frame.push_back(static_cast<char>((len >> 8) & 0xFF));
  bad_frame.push_back(static_cast<char>(len & 0xFF));
  bad_frame += bad_payload;

  std::string good_frame = encode_frame(make_test_record("app", "good"));
  boost::asio::write(raw, boost::asio::buffer(bad_frame + good_frame));

  auto received = drain(1);
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].message, "good");
  EXPECT_EQ(server_->stats().decode_errors, 1u);
}

TEST_F(ChannelTransportTest, InvalidFrameLengthEndsSession) {
  boost::asio::io_context io;
  boost::asio::local::stream_protocol::socket raw(io);
  raw.connect(boost::asio::local::stream_protocol::endpoint(handle_.socket_path()));

  const unsigned char zero_header[4] = {0, 0, 0, 0};
  boost::asio::write(raw, boost::asio::buffer(zero_header, sizeof(zero_header)));

  EXPECT_TRUE(wait_for([this]() {
    return server_->stats().decode_errors == 1 && server_->active_sessions() == 0;
  }));
}

TEST_F(ChannelTransportTest, SecondServerOnLiveEndpointFails) {
  RecordChannel other;
  EXPECT_THROW(ChannelServer second(other, handle_), ChannelBindError);
  // The live owner keeps its socket
  EXPECT_TRUE(fs::exists(handle_.socket_path()));
}

TEST(ChannelServerBindTest, StaleSocketIsReplaced) {
  TempDirectory dir;
  auto handle = RecordChannelHandle::generate(dir.string());
  RecordChannel channel;

  {
    // Bound but never started or stopped cleanly: simulate a crashed owner
    boost::asio::io_context io;
    boost::asio::local::stream_protocol::acceptor stale(io);
    stale.open(boost::asio::local::stream_protocol());
    stale.bind(boost::asio::local::stream_protocol::endpoint(handle.socket_path()));
  }
  ASSERT_TRUE(fs::exists(handle.socket_path()));

  ChannelServer server(channel, handle);
  server.start();
  ChannelClient client(handle);
  client.send(make_test_record("app", "after takeover"));
  ASSERT_TRUE(client.flush());

  auto rec = channel.receive_for(std::chrono::milliseconds(2000));
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->message, "after takeover");
}

TEST(ChannelServerBindTest, RegularFileIsNotReplaced) {
  TempDirectory dir;
  std::string path = dir.write_file("occupied.sock", "data");
  RecordChannel channel;

  EXPECT_THROW(ChannelServer server(channel, RecordChannelHandle(path)), ChannelBindError);
  EXPECT_EQ(funnel::test::read_file(path), "data");
}

TEST(ChannelServerBindTest, MissingDirectoryFails) {
  TempDirectory dir;
  RecordChannel channel;
  RecordChannelHandle handle((dir.path() / "missing" / "x.sock").string());
  EXPECT_THROW(ChannelServer server(channel, handle), ChannelBindError);
}

TEST(ChannelServerBindTest, EmptyHandleFails) {
  RecordChannel channel;
  EXPECT_THROW(ChannelServer server(channel, RecordChannelHandle{}), ChannelBindError);
}

TEST(ChannelClientConnectTest, EmptyHandleIsInvalidArgument) {
  EXPECT_THROW(ChannelClient client(RecordChannelHandle{}), std::invalid_argument);
}

TEST(ChannelClientConnectTest, UnreachableEndpointFails) {
  TempDirectory dir;
  RecordChannelHandle handle(dir.file("nobody.sock"));
  EXPECT_THROW(ChannelClient client(handle), ChannelConnectError);
}
