// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_CHANNEL_SERVER_HPP
#define FUNNEL_CHANNEL_SERVER_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include "channel_handle.hpp"
#include "record_channel.hpp"

namespace funnel {
namespace channel {

/**
 * Counters of the owner-side endpoint.
 */
struct ServerStats {
  uint64_t connections_accepted = 0;
  uint64_t records_received = 0;  // Decoded and handed to the channel
  uint64_t records_rejected = 0;  // Channel refused them (closed or dropped)
  uint64_t decode_errors = 0;
};

/**
 * Owner side of the cross-process carrier.
 *
 * Listens on a Unix-domain stream socket. Every worker connection is a
 * session that reads frames in order and sends the decoded records into the
 * RecordChannel, so each producer's records arrive in send order.
 */
class ChannelServer {
public:
  /**
   * Bind the endpoint. A stale socket file left by a dead owner is replaced;
   * a live one is not.
   *
   * @throws ChannelBindError if the endpoint cannot be created
   */
  ChannelServer(RecordChannel& channel, const RecordChannelHandle& endpoint);

  /**
   * Destructor - stops the server without waiting for sessions
   */
  ~ChannelServer();

  // Non-copyable, non-movable
  ChannelServer(const ChannelServer&) = delete;
  ChannelServer& operator=(const ChannelServer&) = delete;
  ChannelServer(ChannelServer&&) = delete;
  ChannelServer& operator=(ChannelServer&&) = delete;

  /**
   * Start accepting connections on a background I/O thread.
   */
  void start();

  /**
   * Stop accepting, wait up to drain_timeout for connected workers to close
   * their end, then close the remaining sessions, join the I/O thread and
   * remove the socket file. Idempotent.
   */
  void stop(std::chrono::milliseconds drain_timeout = std::chrono::milliseconds(0));

  bool is_running() const {
    return running_.load();
  }

  const RecordChannelHandle& handle() const {
    return endpoint_;
  }

  size_t active_sessions() const;

  ServerStats stats() const;

private:
  class Session;
  friend class Session;

  void do_accept();
  void on_session_closed(const std::shared_ptr<Session>& session);
  void remove_socket_file();

  RecordChannel& channel_;
  RecordChannelHandle endpoint_;

  boost::asio::io_context io_context_;
  boost::asio::local::stream_protocol::acceptor acceptor_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
    work_guard_;
  std::unique_ptr<std::thread> io_thread_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  bool owns_socket_file_ = false;

  mutable std::mutex sessions_mutex_;
  std::condition_variable sessions_cv_;
  std::set<std::shared_ptr<Session>> sessions_;

  std::atomic<uint64_t> connections_accepted_{0};
  std::atomic<uint64_t> records_received_{0};
  std::atomic<uint64_t> records_rejected_{0};
  std::atomic<uint64_t> decode_errors_{0};
};

}  // namespace channel
}  // namespace funnel

#endif  // FUNNEL_CHANNEL_SERVER_HPP
