// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LIFECYCLE_MANAGER_HPP
#define FUNNEL_LIFECYCLE_MANAGER_HPP

#include <memory>
#include <mutex>

#include "channel_handle.hpp"
#include "channel_server.hpp"
#include "collector_loop.hpp"
#include "dispatcher.hpp"
#include "logging_config.hpp"
#include "record_channel.hpp"

namespace funnel {
namespace pipeline {

/**
 * Brings the aggregation owner's pipeline up and down in a fixed order.
 *
 * start(): RecordChannel, then the collector thread, then the socket server,
 * so nothing can arrive before someone is draining.
 *
 * stop(): stop accepting workers and wait up to drain_timeout for their
 * sessions to end, close the channel, let the collector write what is left
 * and close the sinks, remove the socket file.
 *
 * The channel and collector objects outlive stop() so late callers observe a
 * closed pipeline instead of a dangling one.
 */
class LifecycleManager {
public:
  LifecycleManager(Dispatcher& dispatcher, const config::ChannelSettings& settings);

  /**
   * Destructor - stops the pipeline if still running
   */
  ~LifecycleManager();

  // Non-copyable, non-movable
  LifecycleManager(const LifecycleManager&) = delete;
  LifecycleManager& operator=(const LifecycleManager&) = delete;
  LifecycleManager(LifecycleManager&&) = delete;
  LifecycleManager& operator=(LifecycleManager&&) = delete;

  /**
   * @throws ChannelBindError if the endpoint cannot be created; the
   *         collector is stopped again before the error propagates
   */
  void start();

  /**
   * Drain and shut down. Idempotent.
   */
  void stop();

  bool is_running() const;

  bool is_stopped() const;

  /**
   * Endpoint workers connect to. Valid after start().
   */
  const channel::RecordChannelHandle& handle() const {
    return handle_;
  }

  /**
   * Valid after start().
   */
  CollectorLoop& collector();

  channel::RecordChannel& channel();

  channel::ServerStats server_stats() const;

private:
  Dispatcher& dispatcher_;
  config::ChannelSettings settings_;
  channel::RecordChannelHandle handle_;

  std::unique_ptr<channel::RecordChannel> channel_;
  std::unique_ptr<CollectorLoop> collector_;
  std::unique_ptr<channel::ChannelServer> server_;
  channel::ServerStats final_server_stats_;

  mutable std::mutex mutex_;
  bool started_ = false;
  bool stopped_ = false;
};

}  // namespace pipeline
}  // namespace funnel

#endif  // FUNNEL_LIFECYCLE_MANAGER_HPP
