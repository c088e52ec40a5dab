// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "collector_loop.hpp"

#include <exception>
#include <optional>

#define FUNNEL_LOG_COMPONENT "collector"
#include <funnel_log_macros.hpp>

using funnel::logging::kv;

namespace funnel {
namespace pipeline {

const char* to_string(CollectorState state) {
  switch (state) {
    case CollectorState::not_started:
      return "not_started";
    case CollectorState::running:
      return "running";
    case CollectorState::draining:
      return "draining";
    case CollectorState::stopped:
      return "stopped";
    default:
      return "unknown";
  }
}

CollectorLoop::CollectorLoop(channel::RecordChannel& channel, Dispatcher& dispatcher)
    : channel_(channel)
    , dispatcher_(dispatcher) {}

CollectorLoop::~CollectorLoop() {
  stop();
}

void CollectorLoop::start() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ != CollectorState::not_started) {
    return;
  }
  state_ = CollectorState::running;
  thread_ = std::make_unique<std::thread>(&CollectorLoop::drain_loop, this);
  FUNNEL_LOG_DEBUG("Collector started");
}

void CollectorLoop::drain_loop() {
  while (true) {
    std::optional<record::LogRecord> record = channel_.receive_blocking();
    if (!record) {
      break;
    }

    processed_++;
    try {
      dispatcher_.dispatch(*record);
    } catch (const std::exception& e) {
      // Keep draining: one bad record must not silence the rest
      FUNNEL_LOG_ERROR(
        "Failed to dispatch record" << kv("channel", record->channel) << kv("error", e.what())
      );
    }
    {
      std::lock_guard<std::mutex> lock(idle_mutex_);
      drained_++;
    }
    idle_cv_.notify_all();
  }
}

void CollectorLoop::stop() {
  std::unique_lock<std::mutex> lock(state_mutex_);

  if (state_ == CollectorState::stopped) {
    return;
  }
  if (state_ == CollectorState::draining) {
    state_cv_.wait(lock, [this]() {
      return state_ == CollectorState::stopped;
    });
    return;
  }

  bool inline_drain = state_ == CollectorState::not_started;
  state_ = CollectorState::draining;
  lock.unlock();

  channel_.close();
  if (inline_drain) {
    FUNNEL_LOG_DEBUG("Collector stopped before start, draining inline");
    drain_loop();
  } else if (thread_ && thread_->joinable()) {
    thread_->join();
  }
  dispatcher_.close();
  idle_cv_.notify_all();

  lock.lock();
  state_ = CollectorState::stopped;
  thread_.reset();
  lock.unlock();
  state_cv_.notify_all();

  DispatchStats totals = dispatcher_.stats();
  FUNNEL_LOG_DEBUG(
    "Collector stopped" << kv("processed", processed_.load()) << kv("written", totals.lines_written)
                        << kv("write_failures", totals.write_failures)
  );
}

size_t CollectorLoop::dispatch_now(const record::LogRecord& record) {
  if (state() == CollectorState::stopped) {
    return 0;
  }
  processed_++;
  return dispatcher_.dispatch(record);
}

bool CollectorLoop::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() {
    return drained_ >= channel_.accepted_count() || state() == CollectorState::stopped;
  });
}

CollectorState CollectorLoop::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

CollectorStats CollectorLoop::stats() const {
  DispatchStats totals = dispatcher_.stats();
  CollectorStats stats;
  stats.processed = processed_.load();
  stats.written = totals.lines_written;
  stats.write_failures = totals.write_failures;
  return stats;
}

}  // namespace pipeline
}  // namespace funnel
