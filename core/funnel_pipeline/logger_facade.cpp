// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "logger_facade.hpp"

#include <exception>
#include <utility>

#include "config_parser.hpp"
#include "funnel_errors.hpp"
#include "funnel_log_init.hpp"
#include "sink_factory.hpp"

#define FUNNEL_LOG_COMPONENT "facade"
#include <funnel_log_macros.hpp>

using funnel::logging::kv;

namespace funnel {
namespace pipeline {

namespace {

config::LoggingConfig load_config(const std::string& config_path) {
  config::ConfigParser parser;
  config::LoggingConfig config;
  if (!parser.load_from_file(config_path, config)) {
    throw ConfigParseError(parser.get_last_error());
  }
  return config;
}

FacadeOptions make_options(
  bool use_multiprocess, int64_t queue_capacity,
  std::optional<channel::RecordChannelHandle> external_channel
) {
  FacadeOptions options;
  options.use_multiprocess = use_multiprocess;
  options.queue_capacity = queue_capacity;
  options.external_channel = std::move(external_channel);
  return options;
}

}  // namespace

const char* to_string(EmitResult result) {
  switch (result) {
    case EmitResult::delivered:
      return "delivered";
    case EmitResult::filtered:
      return "filtered";
    case EmitResult::dropped:
      return "dropped";
    case EmitResult::channel_closed:
      return "channel_closed";
    default:
      return "unknown";
  }
}

// ============================================================================
// Channel
// ============================================================================

Channel::Channel(LoggerFacade& facade, std::string name)
    : facade_(&facade)
    , name_(std::move(name)) {}

EmitResult Channel::log(
  severity_level level, const std::string& message, std::optional<record::SourceLocation> location
) const {
  return facade_->emit(name_, level, message, std::move(location));
}

bool Channel::is_enabled_for(severity_level level) const {
  return facade_->is_enabled_for(name_, level);
}

// ============================================================================
// LoggerFacade
// ============================================================================

LoggerFacade::LoggerFacade(
  const std::string& config_path, bool use_multiprocess, int64_t queue_capacity,
  std::optional<channel::RecordChannelHandle> external_channel
)
    : config_(load_config(config_path)) {
  initialize(make_options(use_multiprocess, queue_capacity, std::move(external_channel)));
}

LoggerFacade::LoggerFacade(
  const std::string& config_path, const channel::RecordChannelHandle& handle
)
    : LoggerFacade(config_path, true, config::kUnboundedQueue, handle) {}

LoggerFacade::LoggerFacade(config::LoggingConfig config, FacadeOptions options)
    : config_(std::move(config)) {
  initialize(std::move(options));
}

LoggerFacade::~LoggerFacade() {
  stop();
}

void LoggerFacade::initialize(FacadeOptions options) {
  if (options.init_diagnostics) {
    logging::DiagnosticsConfig diagnostics = config_.diagnostics;
    logging::apply_env_overrides(diagnostics);
    logging::init_diagnostics(diagnostics);
  }

  mode_ = resolve_mode(options.use_multiprocess, options.external_channel);
  if (mode_ == OperatingMode::standalone && options.external_channel) {
    FUNNEL_LOG_INFO(
      "Multiprocess logging not requested, ignoring supplied channel"
      << kv("channel", options.external_channel->to_string())
    );
  }

  if (mode_ == OperatingMode::worker) {
    // Workers keep the channel levels only; the owner holds every sink
    config_.handlers.clear();
    config_.root.handlers.clear();
    for (auto& entry : config_.loggers) {
      entry.second.handlers.clear();
    }
  }
  registry_ = std::make_shared<ChannelRegistry>(config_);

  switch (mode_) {
    case OperatingMode::standalone: {
      sinks::SinkFactory factory(*options.out, *options.err, options.clock);
      StandaloneState state;
      state.dispatcher = std::make_unique<Dispatcher>(config_, registry_, factory);
      state_ = std::move(state);
      break;
    }
    case OperatingMode::aggregation_owner: {
      sinks::SinkFactory factory(*options.out, *options.err, options.clock);
      config::ChannelSettings settings = config_.multiprocess;
      if (options.queue_capacity != config::kUnboundedQueue) {
        settings.queue_size = options.queue_capacity;
      }

      OwnerState state;
      state.dispatcher = std::make_unique<Dispatcher>(config_, registry_, factory);
      state.lifecycle = std::make_unique<LifecycleManager>(*state.dispatcher, settings);
      state.lifecycle->start();
      state_ = std::move(state);
      break;
    }
    case OperatingMode::worker: {
      WorkerState state;
      state.client = std::make_unique<channel::ChannelClient>(*options.external_channel);
      state_ = std::move(state);
      break;
    }
  }

  FUNNEL_LOG_DEBUG("Logger facade ready" << kv("mode", to_string(mode_)));
}

Channel LoggerFacade::get_channel(
  const std::string& name, std::optional<severity_level> default_level
) {
  registry_->obtain(name, default_level);
  return Channel(*this, name);
}

std::optional<channel::RecordChannelHandle> LoggerFacade::get_channel_handle_for_workers() const {
  if (const auto* owner = std::get_if<OwnerState>(&state_)) {
    return owner->lifecycle->handle();
  }
  if (const auto* worker = std::get_if<WorkerState>(&state_)) {
    return worker->client->handle();
  }
  return std::nullopt;
}

EmitResult LoggerFacade::emit(
  const std::string& channel_name, severity_level level, const std::string& message,
  std::optional<record::SourceLocation> location
) {
  if (stopped_.load()) {
    return EmitResult::channel_closed;
  }

  try {
    if (!registry_->is_enabled_for(channel_name, level)) {
      return EmitResult::filtered;
    }
    return route(record::make_record(channel_name, level, message, std::move(location)));
  } catch (const std::exception& e) {
    FUNNEL_LOG_ERROR(
      "Failed to emit record" << kv("channel", channel_name) << kv("error", e.what())
    );
    return EmitResult::dropped;
  }
}

EmitResult LoggerFacade::route(const record::LogRecord& record) {
  if (auto* standalone = std::get_if<StandaloneState>(&state_)) {
    if (standalone->dispatcher->is_closed()) {
      return EmitResult::channel_closed;
    }
    standalone->dispatcher->dispatch(record);
    return EmitResult::delivered;
  }

  if (auto* owner = std::get_if<OwnerState>(&state_)) {
    CollectorLoop& collector = owner->lifecycle->collector();
    if (collector.state() == CollectorState::stopped) {
      return EmitResult::channel_closed;
    }
    collector.dispatch_now(record);
    return EmitResult::delivered;
  }

  auto& worker = std::get<WorkerState>(state_);
  switch (worker.client->send(record)) {
    case channel::ChannelStatus::ok:
      return EmitResult::delivered;
    case channel::ChannelStatus::closed:
      return EmitResult::channel_closed;
    case channel::ChannelStatus::dropped:
    case channel::ChannelStatus::full:
    default:
      return EmitResult::dropped;
  }
}

bool LoggerFacade::flush(std::chrono::milliseconds timeout) {
  if (stopped_.load()) {
    return true;
  }

  if (auto* standalone = std::get_if<StandaloneState>(&state_)) {
    standalone->dispatcher->flush();
    return true;
  }
  if (auto* owner = std::get_if<OwnerState>(&state_)) {
    bool idle = owner->lifecycle->collector().wait_idle(timeout);
    owner->dispatcher->flush();
    return idle;
  }
  return std::get<WorkerState>(state_).client->flush(timeout);
}

void LoggerFacade::stop() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (stopped_.exchange(true)) {
    return;
  }

  if (auto* standalone = std::get_if<StandaloneState>(&state_)) {
    if (standalone->dispatcher) {
      standalone->dispatcher->close();
    }
  } else if (auto* owner = std::get_if<OwnerState>(&state_)) {
    if (owner->lifecycle) {
      owner->lifecycle->stop();
    }
  } else if (auto* worker = std::get_if<WorkerState>(&state_)) {
    if (worker->client) {
      worker->client->close();
    }
  }

  FUNNEL_LOG_DEBUG("Logger facade stopped" << kv("mode", to_string(mode_)));
}

std::vector<SinkFailure> LoggerFacade::sink_failures() const {
  if (const auto* standalone = std::get_if<StandaloneState>(&state_)) {
    return standalone->dispatcher->failures();
  }
  if (const auto* owner = std::get_if<OwnerState>(&state_)) {
    return owner->dispatcher->failures();
  }
  return {};
}

}  // namespace pipeline
}  // namespace funnel
