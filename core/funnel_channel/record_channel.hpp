// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_RECORD_CHANNEL_HPP
#define FUNNEL_RECORD_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "log_record.hpp"
#include "logging_config.hpp"

namespace funnel {
namespace channel {

/**
 * Outcome of handing a record to the channel.
 */
enum class ChannelStatus {
  ok,       // Enqueued
  closed,   // Channel closed; record not enqueued
  dropped,  // Bounded channel full under the drop policy
  full      // try_send() found no space
};

const char* to_string(ChannelStatus status);

/**
 * Multi-producer, single-consumer conduit of log records.
 *
 * Records from one producer thread are received in the order they were sent.
 * close() stops new sends; records already enqueued remain receivable until
 * drained.
 */
class RecordChannel {
public:
  /**
   * @param capacity Maximum number of queued records, config::kUnboundedQueue
   *                 (or any value <= 0) for unbounded
   * @param overflow What send() does when a bounded channel is full
   */
  explicit RecordChannel(
    int64_t capacity = config::kUnboundedQueue,
    config::OverflowPolicy overflow = config::OverflowPolicy::block
  );
  ~RecordChannel();

  // Non-copyable, non-movable
  RecordChannel(const RecordChannel&) = delete;
  RecordChannel& operator=(const RecordChannel&) = delete;
  RecordChannel(RecordChannel&&) = delete;
  RecordChannel& operator=(RecordChannel&&) = delete;

  /**
   * Enqueue a record.
   *
   * Thread-safe. Only waits when the channel is bounded, full and the
   * overflow policy is block; the wait ends on free space or close().
   *
   * @return ok, closed, or dropped (bounded + drop policy)
   */
  ChannelStatus send(record::LogRecord record);

  /**
   * Enqueue without ever waiting.
   *
   * @return ok, closed, or full
   */
  ChannelStatus try_send(record::LogRecord record);

  /**
   * Remove the oldest record, waiting until one is available.
   *
   * @return The record, or std::nullopt once the channel is closed and empty
   */
  std::optional<record::LogRecord> receive_blocking();

  /**
   * Like receive_blocking() but gives up after the timeout.
   */
  std::optional<record::LogRecord> receive_for(std::chrono::milliseconds timeout);

  /**
   * Stop accepting records and wake all waiters. Idempotent.
   */
  void close();

  bool is_closed() const;

  size_t size() const;

  bool empty() const;

  int64_t capacity() const {
    return capacity_;
  }

  bool is_bounded() const {
    return capacity_ > 0;
  }

  /**
   * Records refused by the drop policy.
   */
  uint64_t dropped_count() const {
    return dropped_.load();
  }

  /**
   * Records ever enqueued. Counted with the enqueue, so a receiver can tell
   * whether everything accepted so far has been consumed.
   */
  uint64_t accepted_count() const {
    return accepted_.load();
  }

private:
  bool has_space_locked() const;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<record::LogRecord> queue_;

  int64_t capacity_;
  config::OverflowPolicy overflow_;
  bool closed_ = false;
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> accepted_{0};
};

}  // namespace channel
}  // namespace funnel

#endif  // FUNNEL_RECORD_CHANNEL_HPP
