// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "lifecycle_manager.hpp"

#include <stdexcept>

#include "funnel_errors.hpp"

#define FUNNEL_LOG_COMPONENT "lifecycle"
#include <funnel_log_macros.hpp>

using funnel::logging::kv;

namespace funnel {
namespace pipeline {

LifecycleManager::LifecycleManager(Dispatcher& dispatcher, const config::ChannelSettings& settings)
    : dispatcher_(dispatcher)
    , settings_(settings) {}

LifecycleManager::~LifecycleManager() {
  stop();
}

void LifecycleManager::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    return;
  }

  channel_ = std::make_unique<channel::RecordChannel>(settings_.queue_size, settings_.overflow);
  collector_ = std::make_unique<CollectorLoop>(*channel_, dispatcher_);
  collector_->start();

  handle_ = channel::RecordChannelHandle::generate(settings_.socket_dir);
  try {
    server_ = std::make_unique<channel::ChannelServer>(*channel_, handle_);
  } catch (const ChannelBindError& e) {
    FUNNEL_LOG_ERROR("Cannot create worker endpoint" << kv("error", e.what()));
    collector_->stop();
    stopped_ = true;
    started_ = true;
    throw;
  }
  server_->start();
  started_ = true;

  FUNNEL_LOG_INFO(
    "Aggregation pipeline started"
    << kv("endpoint", handle_.to_string()) << kv("queue_size", settings_.queue_size)
    << kv("overflow", config::to_string(settings_.overflow))
  );
}

void LifecycleManager::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!started_ || stopped_) {
    return;
  }
  stopped_ = true;

  // Workers first: anything they flushed before disconnecting is enqueued
  if (server_) {
    server_->stop(settings_.drain_timeout);
    final_server_stats_ = server_->stats();
    server_.reset();
  }
  collector_->stop();

  CollectorStats stats = collector_->stats();
  FUNNEL_LOG_INFO(
    "Aggregation pipeline stopped"
    << kv("processed", stats.processed) << kv("written", stats.written)
    << kv("write_failures", stats.write_failures) << kv("dropped", channel_->dropped_count())
  );
}

bool LifecycleManager::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !stopped_;
}

bool LifecycleManager::is_stopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

CollectorLoop& LifecycleManager::collector() {
  if (!collector_) {
    throw std::logic_error("Aggregation pipeline not started");
  }
  return *collector_;
}

channel::RecordChannel& LifecycleManager::channel() {
  if (!channel_) {
    throw std::logic_error("Aggregation pipeline not started");
  }
  return *channel_;
}

channel::ServerStats LifecycleManager::server_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (server_) {
    return server_->stats();
  }
  return final_server_stats_;
}

}  // namespace pipeline
}  // namespace funnel
