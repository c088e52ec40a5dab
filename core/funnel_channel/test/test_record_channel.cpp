// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RecordChannel, RecordChannelHandle and the frame codec
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "channel_handle.hpp"
#include "funnel_errors.hpp"
#include "record_channel.hpp"
#include "record_codec.hpp"
#include "test_helpers.hpp"

using namespace funnel;
using namespace funnel::channel;
using funnel::logging::severity_level;
using funnel::test::make_test_record;

// ============================================================================
// RecordChannel
// ============================================================================

class RecordChannelTest : public ::testing::Test {
protected:
  void SetUp() override {
    channel_ = std::make_unique<RecordChannel>();
  }

  void TearDown() override {
    if (channel_) {
      channel_->close();
    }
  }

  std::unique_ptr<RecordChannel> channel_;
};

TEST_F(RecordChannelTest, SendReceive) {
  auto rec = make_test_record("app", "hello", severity_level::warning);
  ASSERT_EQ(channel_->send(rec), ChannelStatus::ok);
  EXPECT_EQ(channel_->size(), 1u);
  EXPECT_FALSE(channel_->empty());

  auto received = channel_->receive_for(std::chrono::milliseconds(100));
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, rec);
  EXPECT_TRUE(channel_->empty());
}

TEST_F(RecordChannelTest, FifoOrder) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_EQ(channel_->send(make_test_record("app", "m" + std::to_string(i))), ChannelStatus::ok);
  }
  for (int i = 0; i < 10; ++i) {
    auto received = channel_->receive_for(std::chrono::milliseconds(100));
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->message, "m" + std::to_string(i));
  }
}

TEST_F(RecordChannelTest, ReceiveTimeout) {
  auto start = std::chrono::steady_clock::now();
  auto result = channel_->receive_for(std::chrono::milliseconds(100));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.has_value());
  EXPECT_GE(elapsed, std::chrono::milliseconds(90));
}

TEST_F(RecordChannelTest, UnboundedByDefault) {
  EXPECT_FALSE(channel_->is_bounded());
  EXPECT_EQ(channel_->capacity(), config::kUnboundedQueue);
  for (int i = 0; i < 10000; ++i) {
    ASSERT_EQ(channel_->try_send(make_test_record("app", "x")), ChannelStatus::ok);
  }
  EXPECT_EQ(channel_->size(), 10000u);
}

TEST_F(RecordChannelTest, PerProducerOrderIsPreserved) {
  const int kProducers = 4;
  const int kPerProducer = 500;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p]() {
      for (int i = 0; i < kPerProducer; ++i) {
        channel_->send(make_test_record("p" + std::to_string(p), std::to_string(i)));
      }
    });
  }

  std::map<std::string, int> last_seen;
  int total = 0;
  while (total < kProducers * kPerProducer) {
    auto rec = channel_->receive_for(std::chrono::milliseconds(2000));
    ASSERT_TRUE(rec.has_value());
    int index = std::stoi(rec->message);
    auto it = last_seen.find(rec->channel);
    if (it != last_seen.end()) {
      EXPECT_GT(index, it->second) << "out of order for " << rec->channel;
    }
    last_seen[rec->channel] = index;
    total++;
  }

  for (auto& t : producers) {
    t.join();
  }
  EXPECT_EQ(last_seen.size(), static_cast<size_t>(kProducers));
}

TEST_F(RecordChannelTest, CloseRejectsNewSends) {
  channel_->close();
  EXPECT_TRUE(channel_->is_closed());
  EXPECT_EQ(channel_->send(make_test_record("app", "late")), ChannelStatus::closed);
  EXPECT_EQ(channel_->try_send(make_test_record("app", "late")), ChannelStatus::closed);
}

TEST_F(RecordChannelTest, CloseIsIdempotent) {
  channel_->close();
  channel_->close();
  EXPECT_TRUE(channel_->is_closed());
}

TEST_F(RecordChannelTest, PendingRecordsSurviveClose) {
  channel_->send(make_test_record("app", "one"));
  channel_->send(make_test_record("app", "two"));
  channel_->close();

  auto first = channel_->receive_blocking();
  auto second = channel_->receive_blocking();
  auto end = channel_->receive_blocking();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->message, "one");
  EXPECT_EQ(second->message, "two");
  EXPECT_FALSE(end.has_value());
}

TEST_F(RecordChannelTest, CloseWakesBlockedReceiver) {
  std::atomic<bool> returned{false};
  std::thread receiver([this, &returned]() {
    auto rec = channel_->receive_blocking();
    EXPECT_FALSE(rec.has_value());
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(returned.load());
  channel_->close();
  receiver.join();
  EXPECT_TRUE(returned.load());
}

TEST(BoundedRecordChannelTest, DropPolicyDiscardsWhenFull) {
  RecordChannel channel(2, config::OverflowPolicy::drop);
  EXPECT_TRUE(channel.is_bounded());

  EXPECT_EQ(channel.send(make_test_record("app", "a")), ChannelStatus::ok);
  EXPECT_EQ(channel.send(make_test_record("app", "b")), ChannelStatus::ok);
  EXPECT_EQ(channel.send(make_test_record("app", "c")), ChannelStatus::dropped);
  EXPECT_EQ(channel.dropped_count(), 1u);
  EXPECT_EQ(channel.size(), 2u);

  // The survivors are the oldest records
  EXPECT_EQ(channel.receive_for(std::chrono::milliseconds(10))->message, "a");
  EXPECT_EQ(channel.receive_for(std::chrono::milliseconds(10))->message, "b");
}

TEST(BoundedRecordChannelTest, TrySendReportsFull) {
  RecordChannel channel(1, config::OverflowPolicy::block);
  EXPECT_EQ(channel.try_send(make_test_record("app", "a")), ChannelStatus::ok);
  EXPECT_EQ(channel.try_send(make_test_record("app", "b")), ChannelStatus::full);
  EXPECT_EQ(channel.dropped_count(), 0u);
}

TEST(BoundedRecordChannelTest, BlockPolicyWaitsForSpace) {
  RecordChannel channel(1, config::OverflowPolicy::block);
  ASSERT_EQ(channel.send(make_test_record("app", "first")), ChannelStatus::ok);

  std::atomic<bool> sent{false};
  std::thread producer([&]() {
    EXPECT_EQ(channel.send(make_test_record("app", "second")), ChannelStatus::ok);
    sent = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(sent.load());

  auto first = channel.receive_for(std::chrono::milliseconds(100));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->message, "first");

  producer.join();
  EXPECT_TRUE(sent.load());
  auto second = channel.receive_for(std::chrono::milliseconds(100));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->message, "second");
}

TEST(BoundedRecordChannelTest, CloseReleasesBlockedSender) {
  RecordChannel channel(1, config::OverflowPolicy::block);
  ASSERT_EQ(channel.send(make_test_record("app", "first")), ChannelStatus::ok);

  ChannelStatus status = ChannelStatus::ok;
  std::thread producer([&]() {
    status = channel.send(make_test_record("app", "second"));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  channel.close();
  producer.join();
  EXPECT_EQ(status, ChannelStatus::closed);
}

TEST(BoundedRecordChannelTest, AcceptedCountExcludesRefusedRecords) {
  RecordChannel channel(1, config::OverflowPolicy::drop);
  EXPECT_EQ(channel.send(make_test_record("app", "kept")), ChannelStatus::ok);
  EXPECT_EQ(channel.send(make_test_record("app", "dropped")), ChannelStatus::dropped);
  EXPECT_EQ(channel.try_send(make_test_record("app", "full")), ChannelStatus::full);
  EXPECT_EQ(channel.accepted_count(), 1u);

  // Receiving does not change it
  ASSERT_TRUE(channel.receive_blocking().has_value());
  EXPECT_EQ(channel.accepted_count(), 1u);

  channel.close();
  EXPECT_EQ(channel.send(make_test_record("app", "late")), ChannelStatus::closed);
  EXPECT_EQ(channel.accepted_count(), 1u);
}

TEST(BoundedRecordChannelTest, NonPositiveCapacityIsUnbounded) {
  RecordChannel channel(0, config::OverflowPolicy::drop);
  EXPECT_FALSE(channel.is_bounded());
}

TEST(ChannelStatusTest, ToString) {
  EXPECT_STREQ(to_string(ChannelStatus::ok), "ok");
  EXPECT_STREQ(to_string(ChannelStatus::closed), "closed");
  EXPECT_STREQ(to_string(ChannelStatus::dropped), "dropped");
  EXPECT_STREQ(to_string(ChannelStatus::full), "full");
}

// ============================================================================
// RecordChannelHandle
// ============================================================================

TEST(RecordChannelHandleTest, TextRoundTrip) {
  RecordChannelHandle handle("/tmp/funnel-a.sock");
  EXPECT_EQ(handle.to_string(), "unix:/tmp/funnel-a.sock");
  EXPECT_EQ(RecordChannelHandle::from_string(handle.to_string()), handle);
}

TEST(RecordChannelHandleTest, RejectsMalformedText) {
  EXPECT_THROW(RecordChannelHandle::from_string(""), std::invalid_argument);
  EXPECT_THROW(RecordChannelHandle::from_string("tcp:/tmp/x"), std::invalid_argument);
  EXPECT_THROW(RecordChannelHandle::from_string("unix:"), std::invalid_argument);
}

TEST(RecordChannelHandleTest, GenerateIsUniqueWithinDirectory) {
  funnel::test::TempDirectory dir;
  auto a = RecordChannelHandle::generate(dir.string());
  auto b = RecordChannelHandle::generate(dir.string());
  EXPECT_TRUE(a.valid());
  EXPECT_NE(a, b);
  EXPECT_EQ(a.socket_path().rfind(dir.string(), 0), 0u);
}

TEST(RecordChannelHandleTest, DefaultIsInvalid) {
  RecordChannelHandle handle;
  EXPECT_FALSE(handle.valid());
}

// ============================================================================
// Frame codec
// ============================================================================

TEST(RecordCodecTest, PayloadCarriesEveryField) {
  auto rec = make_test_record("app.sub", "tab\there \"quoted\"", severity_level::error);
  rec.location = record::SourceLocation{"/src/worker.cpp", 17, "run"};

  auto decoded = decode_payload(encode_payload(rec));
  EXPECT_EQ(decoded, rec);
}

TEST(RecordCodecTest, LocationIsOptional) {
  auto rec = make_test_record("", "root record");
  auto decoded = decode_payload(encode_payload(rec));
  EXPECT_FALSE(decoded.location.has_value());
  EXPECT_EQ(decoded.channel, "");
}

TEST(RecordCodecTest, InvalidUtf8MessageKeepsItsBytes) {
  const std::string raw("caf\xE9 \xFF\xFE end\xC3", 12);
  auto rec = make_test_record("app", raw);
  rec.location = record::SourceLocation{"/src/\xE9.cpp", 3, "run"};

  std::string payload = encode_payload(rec);
  EXPECT_NE(payload.find("\"msg_bytes\""), std::string::npos);
  EXPECT_NE(payload.find("\"file_bytes\""), std::string::npos);
  EXPECT_EQ(payload.find("\"msg\""), std::string::npos);

  auto decoded = decode_payload(payload);
  EXPECT_EQ(decoded.message, raw);
  EXPECT_EQ(decoded, rec);
}

TEST(RecordCodecTest, ValidUtf8StaysPlainText) {
  auto rec = make_test_record("app", "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x99\x82");
  std::string payload = encode_payload(rec);
  EXPECT_NE(payload.find("\"msg\""), std::string::npos);
  EXPECT_EQ(payload.find("_bytes"), std::string::npos);
  EXPECT_EQ(decode_payload(payload).message, rec.message);

  // Overlong encodings and surrogates are not valid UTF-8
  EXPECT_NE(encode_payload(make_test_record("app", "\xC0\xAF")).find("msg_bytes"), std::string::npos);
  EXPECT_NE(
    encode_payload(make_test_record("app", "\xED\xA0\x80")).find("msg_bytes"), std::string::npos
  );
}

TEST(RecordCodecTest, RejectsMalformedByteFields) {
  EXPECT_THROW(
    decode_payload(
      R"({"ts_ns": 1, "channel": "app", "level": "INFO", "msg_bytes": [104, 256], "pid": 1, "tid": 1})"
    ),
    RecordDecodeError
  );
  EXPECT_THROW(
    decode_payload(
      R"({"ts_ns": 1, "channel": "app", "level": "INFO", "msg_bytes": "hi", "pid": 1, "tid": 1})"
    ),
    RecordDecodeError
  );
  auto decoded = decode_payload(
    R"({"ts_ns": 1, "channel": "app", "level": "INFO", "msg_bytes": [104, 105], "pid": 1, "tid": 1})"
  );
  EXPECT_EQ(decoded.message, "hi");
}

TEST(RecordCodecTest, FrameHeaderIsBigEndianLength) {
  auto rec = make_test_record("app", "m");
  std::string payload = encode_payload(rec);
  std::string frame = encode_frame(rec);

  ASSERT_EQ(frame.size(), kFrameHeaderSize + payload.size());
  const unsigned char* header = reinterpret_cast<const unsigned char*>(frame.data());
  EXPECT_EQ(decode_frame_length(header), payload.size());
  EXPECT_EQ(frame.substr(kFrameHeaderSize), payload);
}

TEST(RecordCodecTest, RejectsInvalidFrameLengths) {
  const unsigned char zero[4] = {0, 0, 0, 0};
  const unsigned char huge[4] = {0x7F, 0xFF, 0xFF, 0xFF};
  EXPECT_THROW(decode_frame_length(zero), RecordDecodeError);
  EXPECT_THROW(decode_frame_length(huge), RecordDecodeError);
}

TEST(RecordCodecTest, RejectsMalformedPayloads) {
  EXPECT_THROW(decode_payload("not json"), RecordDecodeError);
  EXPECT_THROW(decode_payload("[1, 2]"), RecordDecodeError);
  EXPECT_THROW(decode_payload(R"({"channel": "app"})"), RecordDecodeError);
  EXPECT_THROW(
    decode_payload(
      R"({"ts_ns": 1, "channel": "app", "level": "LOUD", "msg": "m", "pid": 1, "tid": 1})"
    ),
    RecordDecodeError
  );
  EXPECT_THROW(
    decode_payload(
      R"({"ts_ns": "1", "channel": "app", "level": "INFO", "msg": "m", "pid": 1, "tid": 1})"
    ),
    RecordDecodeError
  );
}
