// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_CHANNEL_CLIENT_HPP
#define FUNNEL_CHANNEL_CLIENT_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "channel_handle.hpp"
#include "log_record.hpp"
#include "record_channel.hpp"

namespace funnel {
namespace channel {

/**
 * Worker side of the cross-process carrier.
 *
 * send() encodes the record on the calling thread and appends the frame to an
 * unbounded outbox; a feeder thread writes frames to the socket in order, so
 * producers never wait for the owner.
 */
class ChannelClient {
public:
  /**
   * Connect to the owner's endpoint.
   *
   * @throws std::invalid_argument if the handle is empty
   * @throws ChannelConnectError if the endpoint cannot be reached
   */
  explicit ChannelClient(const RecordChannelHandle& handle);

  /**
   * Destructor - drains the outbox and disconnects
   */
  ~ChannelClient();

  // Non-copyable, non-movable
  ChannelClient(const ChannelClient&) = delete;
  ChannelClient& operator=(const ChannelClient&) = delete;
  ChannelClient(ChannelClient&&) = delete;
  ChannelClient& operator=(ChannelClient&&) = delete;

  /**
   * Queue a record for the owner.
   *
   * @return ok, or closed after close() or a broken connection
   */
  ChannelStatus send(const record::LogRecord& record);

  /**
   * Wait until every queued frame has been written to the socket.
   *
   * @return true if the outbox drained within the timeout
   */
  bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  /**
   * Drain the outbox, shut the socket down and join the feeder. Idempotent.
   */
  void close();

  bool is_closed() const;

  const RecordChannelHandle& handle() const {
    return handle_;
  }

  uint64_t frames_sent() const {
    return frames_sent_.load();
  }

private:
  void feeder_loop();
  bool write_frame(const std::string& frame);

  RecordChannelHandle handle_;
  boost::asio::io_context io_context_;
  boost::asio::local::stream_protocol::socket socket_;

  mutable std::mutex mutex_;
  std::condition_variable outbox_cv_;
  std::condition_variable drained_cv_;
  std::deque<std::string> outbox_;
  bool in_flight_ = false;
  bool closing_ = false;
  bool broken_ = false;
  std::unique_ptr<std::thread> feeder_;

  std::atomic<uint64_t> frames_sent_{0};
};

}  // namespace channel
}  // namespace funnel

#endif  // FUNNEL_CHANNEL_CLIENT_HPP
