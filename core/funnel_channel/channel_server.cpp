// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "channel_server.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/filesystem.hpp>

#include <array>
#include <string>
#include <utility>

#include "funnel_errors.hpp"
#include "record_codec.hpp"

#define FUNNEL_LOG_COMPONENT "channel_server"
#include <funnel_log_macros.hpp>

using funnel::logging::kv;

namespace funnel {
namespace channel {

namespace asio = boost::asio;
using stream_protocol = asio::local::stream_protocol;

// ============================================================================
// Session: one connected worker
// ============================================================================

class ChannelServer::Session : public std::enable_shared_from_this<ChannelServer::Session> {
public:
  Session(ChannelServer& server, stream_protocol::socket socket)
      : server_(server)
      , socket_(std::move(socket)) {}

  void start() {
    read_header();
  }

  void close() {
    boost::system::error_code ec;
    socket_.shutdown(stream_protocol::socket::shutdown_both, ec);
    socket_.close(ec);
  }

private:
  void read_header() {
    auto self = shared_from_this();
    asio::async_read(
      socket_,
      asio::buffer(header_),
      [this, self](const boost::system::error_code& ec, std::size_t /*bytes*/) {
        if (ec) {
          finish(ec);
          return;
        }

        uint32_t length = 0;
        try {
          length = decode_frame_length(header_.data());
        } catch (const RecordDecodeError& e) {
          // Stream position is lost; nothing after this can be trusted
          server_.decode_errors_++;
          FUNNEL_LOG_WARN("Closing worker session on framing error" << kv("error", e.what()));
          finish(boost::system::error_code());
          return;
        }

        payload_.resize(length);
        read_payload();
      }
    );
  }

  void read_payload() {
    auto self = shared_from_this();
    asio::async_read(
      socket_,
      asio::buffer(&payload_[0], payload_.size()),
      [this, self](const boost::system::error_code& ec, std::size_t /*bytes*/) {
        if (ec) {
          finish(ec);
          return;
        }
        handle_payload();
        read_header();
      }
    );
  }

  void handle_payload() {
    record::LogRecord record;
    try {
      record = decode_payload(payload_);
    } catch (const RecordDecodeError& e) {
      server_.decode_errors_++;
      FUNNEL_LOG_WARN("Discarding malformed record from worker" << kv("error", e.what()));
      return;
    }

    ChannelStatus status = server_.channel_.send(std::move(record));
    if (status == ChannelStatus::ok) {
      server_.records_received_++;
    } else {
      server_.records_rejected_++;
      if (status == ChannelStatus::closed) {
        FUNNEL_LOG_WARN("Record from worker arrived after channel close");
      }
    }
  }

  void finish(const boost::system::error_code& ec) {
    if (ec && ec != asio::error::eof && ec != asio::error::operation_aborted) {
      FUNNEL_LOG_WARN("Worker session ended with error" << kv("error", ec.message()));
    }
    close();
    server_.on_session_closed(shared_from_this());
  }

  ChannelServer& server_;
  stream_protocol::socket socket_;
  std::array<unsigned char, kFrameHeaderSize> header_{};
  std::string payload_;
};

// ============================================================================
// ChannelServer
// ============================================================================

ChannelServer::ChannelServer(RecordChannel& channel, const RecordChannelHandle& endpoint)
    : channel_(channel)
    , endpoint_(endpoint)
    , acceptor_(io_context_) {
  namespace fs = boost::filesystem;

  if (!endpoint_.valid()) {
    throw ChannelBindError("Cannot bind an empty endpoint");
  }
  const std::string& path = endpoint_.socket_path();

  try {
    stream_protocol::endpoint local_endpoint(path);
    boost::system::error_code ec;

    if (fs::exists(fs::path(path), ec)) {
      if (fs::status(fs::path(path), ec).type() != fs::socket_file) {
        throw ChannelBindError("'" + path + "' exists and is not a socket");
      }
      // Refuse to take over an endpoint another owner is serving
      stream_protocol::socket probe(io_context_);
      probe.connect(local_endpoint, ec);
      if (!ec) {
        throw ChannelBindError("Endpoint '" + path + "' is already served by another owner");
      }
      fs::remove(fs::path(path), ec);
      if (ec) {
        throw ChannelBindError("Cannot remove stale socket '" + path + "': " + ec.message());
      }
    }

    acceptor_.open(local_endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.bind(local_endpoint, ec);
    }
    if (ec) {
      throw ChannelBindError("Cannot bind '" + path + "': " + ec.message());
    }
    owns_socket_file_ = true;

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
      remove_socket_file();
      throw ChannelBindError("Cannot listen on '" + path + "': " + ec.message());
    }
  } catch (const boost::system::system_error& e) {
    // Raised by the endpoint constructor, e.g. a path longer than sun_path
    throw ChannelBindError("Invalid endpoint '" + path + "': " + e.what());
  }

  FUNNEL_LOG_DEBUG("Channel endpoint bound" << kv("path", path));
}

ChannelServer::~ChannelServer() {
  stop();
}

void ChannelServer::start() {
  if (running_.load() || stopped_.load()) {
    return;
  }
  running_.store(true);

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
    io_context_.get_executor()
  );
  do_accept();
  io_thread_ = std::make_unique<std::thread>([this]() {
    io_context_.run();
  });

  FUNNEL_LOG_INFO("Channel server started" << kv("endpoint", endpoint_.to_string()));
}

void ChannelServer::do_accept() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, stream_protocol::socket socket) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        FUNNEL_LOG_WARN("Accept failed" << kv("error", ec.message()));
        if (running_.load()) {
          do_accept();
        }
      }
      return;
    }
    if (!running_.load()) {
      return;
    }

    auto session = std::make_shared<Session>(*this, std::move(socket));
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      sessions_.insert(session);
    }
    connections_accepted_++;
    session->start();

    do_accept();
  });
}

void ChannelServer::on_session_closed(const std::shared_ptr<Session>& session) {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
  }
  sessions_cv_.notify_all();
}

void ChannelServer::stop(std::chrono::milliseconds drain_timeout) {
  if (stopped_.exchange(true)) {
    return;
  }

  bool was_running = running_.exchange(false);
  if (!was_running) {
    boost::system::error_code ec;
    acceptor_.close(ec);
    remove_socket_file();
    return;
  }

  // No new workers from here on
  asio::post(io_context_, [this]() {
    boost::system::error_code ec;
    acceptor_.close(ec);
  });

  // Give connected workers time to flush and disconnect
  {
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    if (!sessions_cv_.wait_for(lock, drain_timeout, [this]() {
          return sessions_.empty();
        })) {
      FUNNEL_LOG_WARN(
        "Drain timeout expired with workers still connected" << kv("sessions", sessions_.size())
                                                              << kv("timeout_ms",
                                                                    drain_timeout.count())
      );
    }
  }

  asio::post(io_context_, [this]() {
    std::set<std::shared_ptr<Session>> remaining;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      remaining = sessions_;
    }
    for (const auto& session : remaining) {
      session->close();
    }
  });

  work_guard_->reset();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  remove_socket_file();

  FUNNEL_LOG_INFO(
    "Channel server stopped" << kv("connections", connections_accepted_.load())
                             << kv("records", records_received_.load())
                             << kv("decode_errors", decode_errors_.load())
  );
}

void ChannelServer::remove_socket_file() {
  if (!owns_socket_file_) {
    return;
  }
  owns_socket_file_ = false;
  boost::system::error_code ec;
  boost::filesystem::remove(boost::filesystem::path(endpoint_.socket_path()), ec);
  if (ec) {
    FUNNEL_LOG_WARN(
      "Cannot remove socket file" << kv("path", endpoint_.socket_path())
                                  << kv("error", ec.message())
    );
  }
}

size_t ChannelServer::active_sessions() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

ServerStats ChannelServer::stats() const {
  ServerStats stats;
  stats.connections_accepted = connections_accepted_.load();
  stats.records_received = records_received_.load();
  stats.records_rejected = records_rejected_.load();
  stats.decode_errors = decode_errors_.load();
  return stats;
}

}  // namespace channel
}  // namespace funnel
