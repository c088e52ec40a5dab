// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "channel_client.hpp"

#include <sys/socket.h>

#include <stdexcept>
#include <utility>

#include "funnel_errors.hpp"
#include "record_codec.hpp"

#define FUNNEL_LOG_COMPONENT "channel_client"
#include <funnel_log_macros.hpp>

using funnel::logging::kv;

namespace funnel {
namespace channel {

using stream_protocol = boost::asio::local::stream_protocol;

ChannelClient::ChannelClient(const RecordChannelHandle& handle)
    : handle_(handle)
    , socket_(io_context_) {
  if (!handle_.valid()) {
    throw std::invalid_argument("Worker requires a non-empty channel handle");
  }

  boost::system::error_code ec;
  try {
    socket_.connect(stream_protocol::endpoint(handle_.socket_path()), ec);
  } catch (const boost::system::system_error& e) {
    throw ChannelConnectError("Invalid endpoint '" + handle_.to_string() + "': " + e.what());
  }
  if (ec) {
    throw ChannelConnectError("Cannot connect to '" + handle_.to_string() + "': " + ec.message());
  }

  feeder_ = std::make_unique<std::thread>(&ChannelClient::feeder_loop, this);
  FUNNEL_LOG_DEBUG("Connected to channel" << kv("endpoint", handle_.to_string()));
}

ChannelClient::~ChannelClient() {
  close();
}

ChannelStatus ChannelClient::send(const record::LogRecord& record) {
  std::string frame = encode_frame(record);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_ || broken_) {
      return ChannelStatus::closed;
    }
    outbox_.push_back(std::move(frame));
  }
  outbox_cv_.notify_one();
  return ChannelStatus::ok;
}

bool ChannelClient::flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return drained_cv_.wait_for(lock, timeout, [this]() {
    return broken_ || (outbox_.empty() && !in_flight_);
  }) && !broken_;
}

void ChannelClient::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_) {
      return;
    }
    closing_ = true;
  }
  outbox_cv_.notify_all();

  // The feeder drains what is left before it exits
  if (feeder_ && feeder_->joinable()) {
    feeder_->join();
  }
  feeder_.reset();

  boost::system::error_code ec;
  socket_.shutdown(stream_protocol::socket::shutdown_both, ec);
  socket_.close(ec);
}

bool ChannelClient::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closing_ || broken_;
}

bool ChannelClient::write_frame(const std::string& frame) {
  size_t offset = 0;
  while (offset < frame.size()) {
    boost::system::error_code ec;
    // MSG_NOSIGNAL: a vanished owner must not raise SIGPIPE in the worker
    size_t written = socket_.send(
      boost::asio::buffer(frame.data() + offset, frame.size() - offset), MSG_NOSIGNAL, ec
    );
    if (ec == boost::asio::error::interrupted) {
      continue;
    }
    if (ec) {
      FUNNEL_LOG_ERROR(
        "Lost connection to aggregation owner" << kv("endpoint", handle_.to_string())
                                               << kv("error", ec.message())
      );
      return false;
    }
    offset += written;
  }
  return true;
}

void ChannelClient::feeder_loop() {
  while (true) {
    std::string frame;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      outbox_cv_.wait(lock, [this]() {
        return closing_ || !outbox_.empty();
      });
      if (outbox_.empty()) {
        // closing_ and nothing left to write
        break;
      }
      frame = std::move(outbox_.front());
      outbox_.pop_front();
      in_flight_ = true;
    }

    bool ok = write_frame(frame);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = false;
      if (ok) {
        frames_sent_++;
      } else {
        broken_ = true;
        if (!outbox_.empty()) {
          FUNNEL_LOG_ERROR("Discarding unsent records" << kv("count", outbox_.size()));
          outbox_.clear();
        }
      }
    }
    drained_cv_.notify_all();

    if (!ok) {
      break;
    }
  }
  drained_cv_.notify_all();
}

}  // namespace channel
}  // namespace funnel
