// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "record_channel.hpp"

#include <utility>

#define FUNNEL_LOG_COMPONENT "record_channel"
#include <funnel_log_macros.hpp>

namespace funnel {
namespace channel {

const char* to_string(ChannelStatus status) {
  switch (status) {
    case ChannelStatus::ok:
      return "ok";
    case ChannelStatus::closed:
      return "closed";
    case ChannelStatus::dropped:
      return "dropped";
    case ChannelStatus::full:
      return "full";
    default:
      return "unknown";
  }
}

RecordChannel::RecordChannel(int64_t capacity, config::OverflowPolicy overflow)
    : capacity_(capacity > 0 ? capacity : config::kUnboundedQueue)
    , overflow_(overflow) {}

RecordChannel::~RecordChannel() {
  close();
}

bool RecordChannel::has_space_locked() const {
  return capacity_ <= 0 || queue_.size() < static_cast<size_t>(capacity_);
}

ChannelStatus RecordChannel::send(record::LogRecord record) {
  std::unique_lock<std::mutex> lock(mutex_);

  if (closed_) {
    return ChannelStatus::closed;
  }

  if (!has_space_locked()) {
    if (overflow_ == config::OverflowPolicy::drop) {
      uint64_t dropped = ++dropped_;
      lock.unlock();
      FUNNEL_LOG_WARN(
        "Channel full, record dropped" << logging::kv("channel", record.channel)
                                       << logging::kv("capacity", capacity_)
                                       << logging::kv("dropped_total", dropped)
      );
      return ChannelStatus::dropped;
    }
    not_full_.wait(lock, [this] {
      return closed_ || has_space_locked();
    });
    if (closed_) {
      return ChannelStatus::closed;
    }
  }

  queue_.push_back(std::move(record));
  accepted_++;
  lock.unlock();
  not_empty_.notify_one();
  return ChannelStatus::ok;
}

ChannelStatus RecordChannel::try_send(record::LogRecord record) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return ChannelStatus::closed;
    }
    if (!has_space_locked()) {
      return ChannelStatus::full;
    }
    queue_.push_back(std::move(record));
    accepted_++;
  }
  not_empty_.notify_one();
  return ChannelStatus::ok;
}

std::optional<record::LogRecord> RecordChannel::receive_blocking() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this] {
    return closed_ || !queue_.empty();
  });

  if (queue_.empty()) {
    return std::nullopt;
  }

  record::LogRecord record = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return record;
}

std::optional<record::LogRecord> RecordChannel::receive_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!not_empty_.wait_for(lock, timeout, [this] {
        return closed_ || !queue_.empty();
      })) {
    return std::nullopt;
  }

  if (queue_.empty()) {
    return std::nullopt;
  }

  record::LogRecord record = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return record;
}

void RecordChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool RecordChannel::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t RecordChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool RecordChannel::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

}  // namespace channel
}  // namespace funnel
