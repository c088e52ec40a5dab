// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LOGGER_FACADE_HPP
#define FUNNEL_LOGGER_FACADE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "channel_client.hpp"
#include "channel_handle.hpp"
#include "channel_registry.hpp"
#include "dispatcher.hpp"
#include "lifecycle_manager.hpp"
#include "log_record.hpp"
#include "logging_config.hpp"
#include "mode_resolver.hpp"
#include "timed_rotating_file_sink.hpp"

namespace funnel {
namespace pipeline {

/**
 * Outcome of a single emit.
 */
enum class EmitResult {
  delivered,      // Written to sinks, or handed to the owner
  filtered,       // Below the channel's effective level
  dropped,        // Refused by a full bounded channel, or lost to an internal error
  channel_closed  // Facade stopped or owner gone
};

const char* to_string(EmitResult result);

/**
 * Construction options for a facade built from a parsed configuration.
 */
struct FacadeOptions {
  bool use_multiprocess = false;

  // Capacity of the owner's RecordChannel. kUnboundedQueue defers to the
  // `multiprocess.queue_size` setting.
  int64_t queue_capacity = config::kUnboundedQueue;

  // Owner endpoint to forward to; with use_multiprocess this selects worker mode
  std::optional<channel::RecordChannelHandle> external_channel;

  // Streams behind console sinks
  std::ostream* out = &std::cout;
  std::ostream* err = &std::cerr;

  // Clock for time-based rotation
  sinks::Clock clock = sinks::default_clock();

  // Start the diagnostics stream from the `diagnostics:` section
  bool init_diagnostics = true;
};

class LoggerFacade;

/**
 * Lightweight named handle onto a facade. Copyable; must not outlive the
 * facade that produced it.
 */
class Channel {
public:
  Channel(LoggerFacade& facade, std::string name);

  const std::string& name() const {
    return name_;
  }

  EmitResult log(
    severity_level level, const std::string& message,
    std::optional<record::SourceLocation> location = std::nullopt
  ) const;

  EmitResult debug(const std::string& message) const {
    return log(severity_level::debug, message);
  }
  EmitResult info(const std::string& message) const {
    return log(severity_level::info, message);
  }
  EmitResult warning(const std::string& message) const {
    return log(severity_level::warning, message);
  }
  EmitResult error(const std::string& message) const {
    return log(severity_level::error, message);
  }
  EmitResult critical(const std::string& message) const {
    return log(severity_level::critical, message);
  }

  bool is_enabled_for(severity_level level) const;

private:
  LoggerFacade* facade_;
  std::string name_;
};

/**
 * The object callers construct. Resolves the operating mode once and then
 * routes every record accordingly:
 *
 * - standalone: filter, format and write on the caller thread
 * - aggregation_owner: same for its own records; worker records arrive over
 *   the RecordChannel and are written by the collector thread
 * - worker: filter, then forward to the owner; holds no sinks
 *
 * Usage:
 *   LoggerFacade facade("logging.yaml");
 *   auto log = facade.get_channel("app");
 *   log.info("started");
 *   FUNNEL_CHANNEL_WARN(log, "retry " << attempt);
 */
class LoggerFacade {
public:
  /**
   * @param config_path YAML (.yaml/.yml) or JSON (.json) configuration
   * @param use_multiprocess Aggregate records from worker processes
   * @param queue_capacity Owner channel capacity, kUnboundedQueue for the configured default
   * @param external_channel Owner endpoint; with use_multiprocess selects worker mode
   *
   * @throws ConfigParseError if the configuration cannot be loaded
   * @throws ChannelBindError if an owner cannot create its endpoint
   * @throws ChannelConnectError if a worker cannot reach its owner
   */
  explicit LoggerFacade(
    const std::string& config_path, bool use_multiprocess = false,
    int64_t queue_capacity = config::kUnboundedQueue,
    std::optional<channel::RecordChannelHandle> external_channel = std::nullopt
  );

  /**
   * Worker constructor: forward every record to the owner behind handle.
   *
   * @throws std::invalid_argument if the handle is empty
   */
  LoggerFacade(const std::string& config_path, const channel::RecordChannelHandle& handle);

  LoggerFacade(config::LoggingConfig config, FacadeOptions options);

  /**
   * Destructor - calls stop()
   */
  ~LoggerFacade();

  // Non-copyable, non-movable
  LoggerFacade(const LoggerFacade&) = delete;
  LoggerFacade& operator=(const LoggerFacade&) = delete;
  LoggerFacade(LoggerFacade&&) = delete;
  LoggerFacade& operator=(LoggerFacade&&) = delete;

  /**
   * Get a channel handle, registering the name on first use.
   *
   * @param name Dotted channel name; empty for the root
   * @param default_level Level used when the configuration sets none for name
   */
  Channel get_channel(
    const std::string& name = "", std::optional<severity_level> default_level = std::nullopt
  );

  /**
   * Endpoint to pass to worker processes: the owner's own endpoint, the
   * handle a worker was given, nothing in standalone mode.
   */
  std::optional<channel::RecordChannelHandle> get_channel_handle_for_workers() const;

  OperatingMode mode() const {
    return mode_;
  }

  /**
   * Route one record. Never throws; failures go to the diagnostics stream.
   */
  EmitResult emit(
    const std::string& channel_name, severity_level level, const std::string& message,
    std::optional<record::SourceLocation> location = std::nullopt
  );

  bool is_enabled_for(const std::string& channel_name, severity_level level) const {
    return registry_->is_enabled_for(channel_name, level);
  }

  /**
   * Push pending records to their sinks (owner: wait for the collector to
   * catch up; worker: wait for the outbox to reach the owner).
   *
   * @return true if everything pending was flushed within the timeout
   */
  bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  /**
   * Release sinks (standalone), drain and shut the pipeline down (owner) or
   * flush and disconnect (worker). Idempotent.
   */
  void stop();

  bool is_stopped() const {
    return stopped_.load();
  }

  /**
   * Configured sinks that could not be built. Always empty for workers.
   */
  std::vector<SinkFailure> sink_failures() const;

  const config::LoggingConfig& config() const {
    return config_;
  }

private:
  struct StandaloneState {
    std::unique_ptr<Dispatcher> dispatcher;
  };

  struct OwnerState {
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<LifecycleManager> lifecycle;
  };

  struct WorkerState {
    std::unique_ptr<channel::ChannelClient> client;
  };

  void initialize(FacadeOptions options);
  EmitResult route(const record::LogRecord& record);

  config::LoggingConfig config_;
  OperatingMode mode_ = OperatingMode::standalone;
  std::shared_ptr<ChannelRegistry> registry_;
  std::variant<StandaloneState, OwnerState, WorkerState> state_;

  std::mutex stop_mutex_;
  std::atomic<bool> stopped_{false};
};

}  // namespace pipeline
}  // namespace funnel

// =============================================================================
// Channel macros - stream-based API with call-site location
// Usage: FUNNEL_CHANNEL_INFO(log, "loaded " << count << " items");
// The stream expression is evaluated only when the level is enabled.
// =============================================================================

#define FUNNEL_CHANNEL_LOG(channel, level, msg) \
  do { \
    if ((channel).is_enabled_for(level)) { \
      std::ostringstream funnel_channel_stream_; \
      funnel_channel_stream_ << msg; \
      (channel).log( \
        level, funnel_channel_stream_.str(), \
        ::funnel::record::SourceLocation{__FILE__, __LINE__, __func__} \
      ); \
    } \
  } while (0)

#define FUNNEL_CHANNEL_DEBUG(channel, msg) \
  FUNNEL_CHANNEL_LOG(channel, ::funnel::logging::severity_level::debug, msg)
#define FUNNEL_CHANNEL_INFO(channel, msg) \
  FUNNEL_CHANNEL_LOG(channel, ::funnel::logging::severity_level::info, msg)
#define FUNNEL_CHANNEL_WARN(channel, msg) \
  FUNNEL_CHANNEL_LOG(channel, ::funnel::logging::severity_level::warning, msg)
#define FUNNEL_CHANNEL_ERROR(channel, msg) \
  FUNNEL_CHANNEL_LOG(channel, ::funnel::logging::severity_level::error, msg)
#define FUNNEL_CHANNEL_CRITICAL(channel, msg) \
  FUNNEL_CHANNEL_LOG(channel, ::funnel::logging::severity_level::critical, msg)

#endif  // FUNNEL_LOGGER_FACADE_HPP
