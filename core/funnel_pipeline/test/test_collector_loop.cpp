// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for Dispatcher, CollectorLoop and LifecycleManager
 */

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include "channel_client.hpp"
#include "collector_loop.hpp"
#include "config_parser.hpp"
#include "dispatcher.hpp"
#include "funnel_errors.hpp"
#include "lifecycle_manager.hpp"
#include "record_channel.hpp"
#include "sink_factory.hpp"
#include "test_helpers.hpp"

using namespace funnel;
using namespace funnel::pipeline;
using funnel::logging::severity_level;
using funnel::test::make_test_record;
using funnel::test::read_lines;
using funnel::test::TempDirectory;

namespace {

/**
 * Stream buffer that refuses every byte, so each console write fails.
 */
class RefusingBuffer : public std::streambuf {
protected:
  int_type overflow(int_type) override {
    return traits_type::eof();
  }
};

}  // namespace

class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::make_unique<TempDirectory>();
    refusing_stream_ = std::make_unique<std::ostream>(&refusing_buffer_);
  }

  config::LoggingConfig parse(const std::string& yaml) {
    config::ConfigParser parser;
    config::LoggingConfig config;
    EXPECT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();
    return config;
  }

  /**
   * One plain file sink at DEBUG named "file" plus whatever extra handlers
   * the caller appends.
   */
  std::string file_config(const std::string& extra_handlers = "") {
    return "root:\n"
           "  level: DEBUG\n"
           "handlers:\n"
           "  file:\n"
           "    type: file\n"
           "    level: DEBUG\n"
           "    filename: " +
           log_path() +
           "\n"
           "    formatter:\n"
           "      format: \"%(name)s|%(levelname)s|%(message)s\"\n" +
           extra_handlers;
  }

  std::string log_path() const {
    return dir_->file("app.log");
  }

  std::unique_ptr<Dispatcher> make_dispatcher(const config::LoggingConfig& config) {
    registry_ = std::make_shared<ChannelRegistry>(config);
    sinks::SinkFactory factory(out_, *refusing_stream_);
    return std::make_unique<Dispatcher>(config, registry_, factory);
  }

  std::unique_ptr<TempDirectory> dir_;
  std::ostringstream out_;
  RefusingBuffer refusing_buffer_;
  std::unique_ptr<std::ostream> refusing_stream_;
  std::shared_ptr<ChannelRegistry> registry_;
};

// ============================================================================
// Dispatcher
// ============================================================================

TEST_F(DispatcherTest, WritesFormattedLines) {
  auto dispatcher = make_dispatcher(parse(file_config()));
  ASSERT_EQ(dispatcher->sink_count(), 1u);

  EXPECT_EQ(dispatcher->dispatch(make_test_record("app", "hello", severity_level::warning)), 1u);
  dispatcher->close();

  auto lines = read_lines(log_path());
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "app|WARNING|hello");
}

TEST_F(DispatcherTest, HandlerLevelFiltersPerSink) {
  std::string extra =
    "  errors:\n"
    "    type: file\n"
    "    level: ERROR\n"
    "    filename: " +
    dir_->file("errors.log") + "\n";
  auto dispatcher = make_dispatcher(parse(file_config(extra)));

  EXPECT_EQ(dispatcher->dispatch(make_test_record("app", "info", severity_level::info)), 1u);
  EXPECT_EQ(dispatcher->dispatch(make_test_record("app", "bad", severity_level::error)), 2u);
  dispatcher->close();

  EXPECT_EQ(read_lines(log_path()).size(), 2u);
  EXPECT_EQ(read_lines(dir_->file("errors.log")).size(), 1u);
}

TEST_F(DispatcherTest, InvalidPathSinkIsIsolated) {
  std::string extra =
    "  broken:\n"
    "    type: file\n"
    "    filename: " +
    dir_->file("missing/dir/broken.log") + "\n";
  auto dispatcher = make_dispatcher(parse(file_config(extra)));

  ASSERT_EQ(dispatcher->failures().size(), 1u);
  EXPECT_EQ(dispatcher->failures()[0].sink, "broken");
  EXPECT_EQ(dispatcher->failures()[0].path, dir_->file("missing/dir/broken.log"));
  EXPECT_FALSE(dispatcher->has_sink("broken"));
  EXPECT_TRUE(dispatcher->has_sink("file"));

  EXPECT_EQ(dispatcher->dispatch(make_test_record("app", "still works")), 1u);
  dispatcher->close();
  EXPECT_EQ(read_lines(log_path()).size(), 1u);
  EXPECT_FALSE(boost::filesystem::exists(dir_->file("missing")));
}

TEST_F(DispatcherTest, InvalidTemplateDisablesOnlyThatSink) {
  std::string extra =
    "  typo:\n"
    "    type: file\n"
    "    filename: " +
    dir_->file("typo.log") +
    "\n"
    "    formatter:\n"
    "      format: \"%(nonsense)s\"\n";
  auto dispatcher = make_dispatcher(parse(file_config(extra)));

  ASSERT_EQ(dispatcher->failures().size(), 1u);
  EXPECT_EQ(dispatcher->failures()[0].sink, "typo");
  EXPECT_FALSE(boost::filesystem::exists(dir_->file("typo.log")));
  EXPECT_EQ(dispatcher->sink_count(), 1u);
}

TEST_F(DispatcherTest, WriteFailureDoesNotSilenceOtherSinks) {
  std::string extra =
    "  console:\n"
    "    type: stream\n"
    "    stream: stderr\n";
  auto dispatcher = make_dispatcher(parse(file_config(extra)));
  ASSERT_EQ(dispatcher->sink_count(), 2u);

  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(dispatcher->dispatch(make_test_record("app", "m" + std::to_string(i))), 1u);
  }
  DispatchStats stats = dispatcher->stats();
  EXPECT_EQ(stats.records, 3u);
  EXPECT_EQ(stats.lines_written, 3u);
  EXPECT_EQ(stats.write_failures, 3u);

  dispatcher->close();
  EXPECT_EQ(read_lines(log_path()).size(), 3u);
}

TEST_F(DispatcherTest, CloseIsIdempotentAndFinal) {
  auto dispatcher = make_dispatcher(parse(file_config()));
  dispatcher->close();
  dispatcher->close();
  EXPECT_TRUE(dispatcher->is_closed());
  EXPECT_EQ(dispatcher->dispatch(make_test_record("app", "late")), 0u);
  EXPECT_TRUE(read_lines(log_path()).empty());
}

// ============================================================================
// CollectorLoop
// ============================================================================

class CollectorLoopTest : public DispatcherTest {
protected:
  void SetUp() override {
    DispatcherTest::SetUp();
    dispatcher_ = make_dispatcher(parse(file_config()));
    channel_ = std::make_unique<channel::RecordChannel>();
    collector_ = std::make_unique<CollectorLoop>(*channel_, *dispatcher_);
  }

  void TearDown() override {
    collector_.reset();
    channel_.reset();
    dispatcher_.reset();
  }

  std::unique_ptr<Dispatcher> dispatcher_;
  std::unique_ptr<channel::RecordChannel> channel_;
  std::unique_ptr<CollectorLoop> collector_;
};

TEST_F(CollectorLoopTest, StateTransitions) {
  EXPECT_EQ(collector_->state(), CollectorState::not_started);
  collector_->start();
  EXPECT_EQ(collector_->state(), CollectorState::running);
  EXPECT_TRUE(collector_->is_running());
  collector_->stop();
  EXPECT_EQ(collector_->state(), CollectorState::stopped);

  // One-way
  collector_->start();
  EXPECT_EQ(collector_->state(), CollectorState::stopped);
  EXPECT_STREQ(to_string(CollectorState::draining), "draining");
}

TEST_F(CollectorLoopTest, StopWritesEverythingSentBeforeClose) {
  collector_->start();
  const int kRecords = 1000;
  for (int i = 0; i < kRecords; ++i) {
    ASSERT_EQ(channel_->send(make_test_record("app", std::to_string(i))), channel::ChannelStatus::ok);
  }
  collector_->stop();

  auto lines = read_lines(log_path());
  ASSERT_EQ(lines.size(), static_cast<size_t>(kRecords));
  for (int i = 0; i < kRecords; ++i) {
    EXPECT_EQ(lines[i], "app|INFO|" + std::to_string(i));
  }
  EXPECT_EQ(collector_->stats().processed, static_cast<uint64_t>(kRecords));
  EXPECT_EQ(collector_->stats().written, static_cast<uint64_t>(kRecords));
  EXPECT_TRUE(dispatcher_->is_closed());
}

TEST_F(CollectorLoopTest, SendAfterStopIsRejected) {
  collector_->start();
  collector_->stop();
  EXPECT_EQ(channel_->send(make_test_record("app", "late")), channel::ChannelStatus::closed);
  EXPECT_EQ(collector_->dispatch_now(make_test_record("app", "late")), 0u);
  EXPECT_TRUE(read_lines(log_path()).empty());
}

TEST_F(CollectorLoopTest, StopBeforeStartDrainsInline) {
  channel_->send(make_test_record("app", "queued 1"));
  channel_->send(make_test_record("app", "queued 2"));
  collector_->stop();

  EXPECT_EQ(collector_->state(), CollectorState::stopped);
  EXPECT_EQ(read_lines(log_path()), (std::vector<std::string>{"app|INFO|queued 1", "app|INFO|queued 2"}));
}

TEST_F(CollectorLoopTest, StopIsIdempotentAcrossThreads) {
  collector_->start();
  channel_->send(make_test_record("app", "once"));

  std::vector<std::thread> stoppers;
  for (int i = 0; i < 4; ++i) {
    stoppers.emplace_back([this]() {
      collector_->stop();
      EXPECT_EQ(collector_->state(), CollectorState::stopped);
    });
  }
  for (auto& t : stoppers) {
    t.join();
  }
  collector_->stop();
  EXPECT_EQ(read_lines(log_path()).size(), 1u);
}

TEST_F(CollectorLoopTest, DispatchNowInterleavesWithDrain) {
  collector_->start();
  std::thread producer([this]() {
    for (int i = 0; i < 200; ++i) {
      channel_->send(make_test_record("queued", std::to_string(i)));
    }
  });
  for (int i = 0; i < 200; ++i) {
    collector_->dispatch_now(make_test_record("direct", std::to_string(i)));
  }
  producer.join();
  collector_->stop();

  auto lines = read_lines(log_path());
  ASSERT_EQ(lines.size(), 400u);
  // Lines are never torn by concurrent writers
  for (const auto& line : lines) {
    EXPECT_TRUE(line.rfind("queued|INFO|", 0) == 0 || line.rfind("direct|INFO|", 0) == 0) << line;
  }
}

TEST_F(CollectorLoopTest, WaitIdleAfterBurst) {
  collector_->start();
  for (int i = 0; i < 100; ++i) {
    channel_->send(make_test_record("app", std::to_string(i)));
  }
  EXPECT_TRUE(collector_->wait_idle(std::chrono::milliseconds(5000)));
  EXPECT_EQ(read_lines(log_path()).size(), 100u);
}

TEST_F(CollectorLoopTest, WaitIdleCoversRecordInFlight) {
  collector_->start();
  // Each wait starts while the collector may be between taking the record
  // off the channel and writing it
  for (int i = 1; i <= 200; ++i) {
    channel_->send(make_test_record("app", std::to_string(i)));
    ASSERT_TRUE(collector_->wait_idle(std::chrono::milliseconds(5000))) << i;
    ASSERT_EQ(read_lines(log_path()).size(), static_cast<size_t>(i));
  }
}

TEST_F(DispatcherTest, CollectorSurvivesFailingSink) {
  std::string extra =
    "  console:\n"
    "    type: stream\n";
  auto dispatcher = make_dispatcher(parse(file_config(extra)));
  channel::RecordChannel channel;
  CollectorLoop collector(channel, *dispatcher);
  collector.start();

  for (int i = 0; i < 10; ++i) {
    channel.send(make_test_record("app", std::to_string(i)));
  }
  collector.stop();

  EXPECT_EQ(read_lines(log_path()).size(), 10u);
  CollectorStats stats = collector.stats();
  EXPECT_EQ(stats.processed, 10u);
  EXPECT_EQ(stats.written, 10u);
  EXPECT_EQ(stats.write_failures, 10u);
}

// ============================================================================
// LifecycleManager
// ============================================================================

TEST_F(DispatcherTest, LifecycleStartsAndDrainsPipeline) {
  auto dispatcher = make_dispatcher(parse(file_config()));
  config::ChannelSettings settings;
  settings.socket_dir = dir_->string();
  settings.drain_timeout = std::chrono::milliseconds(2000);

  LifecycleManager lifecycle(*dispatcher, settings);
  EXPECT_FALSE(lifecycle.is_running());
  lifecycle.start();
  ASSERT_TRUE(lifecycle.is_running());
  ASSERT_TRUE(lifecycle.handle().valid());
  EXPECT_TRUE(boost::filesystem::exists(lifecycle.handle().socket_path()));
  EXPECT_EQ(lifecycle.collector().state(), CollectorState::running);

  {
    channel::ChannelClient client(lifecycle.handle());
    for (int i = 0; i < 50; ++i) {
      client.send(make_test_record("worker.0", std::to_string(i)));
    }
  }
  lifecycle.stop();
  lifecycle.stop();

  EXPECT_TRUE(lifecycle.is_stopped());
  EXPECT_FALSE(boost::filesystem::exists(lifecycle.handle().socket_path()));
  EXPECT_EQ(lifecycle.collector().state(), CollectorState::stopped);
  EXPECT_EQ(lifecycle.server_stats().records_received, 50u);
  EXPECT_EQ(read_lines(log_path()).size(), 50u);
}

TEST_F(DispatcherTest, LifecycleAppliesQueueSettings) {
  auto dispatcher = make_dispatcher(parse(file_config()));
  config::ChannelSettings settings;
  settings.socket_dir = dir_->string();
  settings.queue_size = 8;
  settings.overflow = config::OverflowPolicy::drop;

  LifecycleManager lifecycle(*dispatcher, settings);
  lifecycle.start();
  EXPECT_EQ(lifecycle.channel().capacity(), 8);
  lifecycle.stop();
}

TEST_F(DispatcherTest, LifecycleBindFailureStopsCollector) {
  auto dispatcher = make_dispatcher(parse(file_config()));
  config::ChannelSettings settings;
  settings.socket_dir = dir_->file("no/such/dir");

  LifecycleManager lifecycle(*dispatcher, settings);
  EXPECT_THROW(lifecycle.start(), ChannelBindError);
  EXPECT_TRUE(lifecycle.is_stopped());
  EXPECT_EQ(lifecycle.collector().state(), CollectorState::stopped);
  lifecycle.stop();
}
