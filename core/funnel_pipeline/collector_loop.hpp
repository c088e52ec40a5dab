// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_COLLECTOR_LOOP_HPP
#define FUNNEL_COLLECTOR_LOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "dispatcher.hpp"
#include "log_record.hpp"
#include "record_channel.hpp"

namespace funnel {
namespace pipeline {

/**
 * CollectorState is one-way:
 * - NOT_STARTED -> RUNNING: start()
 * - RUNNING -> DRAINING: stop() closes the channel
 * - DRAINING -> STOPPED: channel empty, sinks closed
 * - NOT_STARTED -> DRAINING: stop() before start() drains inline
 */
enum class CollectorState {
  not_started,
  running,
  draining,
  stopped
};

const char* to_string(CollectorState state);

struct CollectorStats {
  uint64_t processed = 0;       // Records taken off the channel or dispatched directly
  uint64_t written = 0;         // Lines accepted by sinks
  uint64_t write_failures = 0;  // Sink writes that failed
};

/**
 * The aggregation owner's single writer.
 *
 * A background thread blocks on the RecordChannel and hands every record to
 * the Dispatcher. The owner's own emits use dispatch_now(), which serializes
 * with the drain thread on the dispatcher lock. When the channel is closed
 * and empty the loop closes every sink once and stops.
 */
class CollectorLoop {
public:
  CollectorLoop(channel::RecordChannel& channel, Dispatcher& dispatcher);

  /**
   * Destructor - stops and drains if still running
   */
  ~CollectorLoop();

  // Non-copyable, non-movable
  CollectorLoop(const CollectorLoop&) = delete;
  CollectorLoop& operator=(const CollectorLoop&) = delete;
  CollectorLoop(CollectorLoop&&) = delete;
  CollectorLoop& operator=(CollectorLoop&&) = delete;

  /**
   * Launch the drain thread. No-op unless NOT_STARTED.
   */
  void start();

  /**
   * Close the channel, write everything still queued, close the sinks and
   * join the drain thread. Idempotent; concurrent callers wait for the first.
   */
  void stop();

  /**
   * Write a record produced by the owner itself.
   *
   * @return Number of sinks that accepted it; 0 once stopped
   */
  size_t dispatch_now(const record::LogRecord& record);

  /**
   * Wait until every record the channel accepted so far has been written,
   * including one already taken off the channel but not yet dispatched.
   *
   * @return true if idle within the timeout
   */
  bool wait_idle(std::chrono::milliseconds timeout);

  CollectorState state() const;

  bool is_running() const {
    return state() == CollectorState::running;
  }

  CollectorStats stats() const;

private:
  void drain_loop();

  channel::RecordChannel& channel_;
  Dispatcher& dispatcher_;

  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  CollectorState state_ = CollectorState::not_started;
  std::unique_ptr<std::thread> thread_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  uint64_t drained_ = 0;  // Records taken from the channel and dispatched

  std::atomic<uint64_t> processed_{0};
};

}  // namespace pipeline
}  // namespace funnel

#endif  // FUNNEL_COLLECTOR_LOOP_HPP
