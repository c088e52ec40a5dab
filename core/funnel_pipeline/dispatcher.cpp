// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "dispatcher.hpp"

#include <stdexcept>
#include <utility>

#include "funnel_errors.hpp"

#define FUNNEL_LOG_COMPONENT "dispatcher"
#include <funnel_log_macros.hpp>

using funnel::logging::kv;

namespace funnel {
namespace pipeline {

namespace {

std::string target_of(const config::SinkConfig& sink_config) {
  if (sink_config.kind == config::SinkKind::console) {
    return sink_config.stream;
  }
  return sink_config.filename;
}

}  // namespace

Dispatcher::Dispatcher(
  const config::LoggingConfig& config, std::shared_ptr<ChannelRegistry> registry,
  const sinks::SinkFactory& factory
)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw std::invalid_argument("Dispatcher requires a channel registry");
  }
  for (const auto& sink_config : config.handlers) {
    build_binding(sink_config, factory);
  }
  FUNNEL_LOG_DEBUG(
    "Dispatcher ready" << kv("sinks", bindings_.size()) << kv("failed", failures_.size())
  );
}

Dispatcher::~Dispatcher() {
  close();
}

void Dispatcher::build_binding(
  const config::SinkConfig& sink_config, const sinks::SinkFactory& factory
) {
  try {
    auto binding = std::make_unique<Binding>();
    binding->name = sink_config.name;
    binding->level = sink_config.level;

    // Template errors surface before any file is touched
    try {
      binding->formatter =
        record::RecordFormatter(sink_config.formatter.format, sink_config.formatter.datefmt);
    } catch (const std::invalid_argument& e) {
      throw SinkConstructionError(target_of(sink_config), e.what());
    }

    binding->sink = factory.build(sink_config);
    bindings_[sink_config.name] = std::move(binding);
  } catch (const SinkConstructionError& e) {
    failures_.push_back(SinkFailure{sink_config.name, e.path(), e.reason()});
    FUNNEL_LOG_ERROR(
      "Sink disabled" << kv("sink", sink_config.name) << kv("path", e.path())
                      << kv("reason", e.reason())
    );
  }
}

size_t Dispatcher::dispatch(const record::LogRecord& record) {
  std::vector<std::string> targets = registry_->route(record.channel);

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return 0;
  }
  stats_.records++;

  size_t written = 0;
  for (const auto& target : targets) {
    auto it = bindings_.find(target);
    if (it == bindings_.end()) {
      // Failed at construction
      continue;
    }
    Binding& binding = *it->second;
    if (record.severity < binding.level) {
      continue;
    }

    try {
      binding.sink->write(binding.formatter.format(record), record.severity);
      stats_.lines_written++;
      written++;
    } catch (const SinkWriteError& e) {
      stats_.write_failures++;
      FUNNEL_LOG_ERROR(
        "Sink write failed" << kv("sink", binding.name) << kv("channel", record.channel)
                            << kv("error", e.what())
      );
    } catch (const std::exception& e) {
      stats_.write_failures++;
      FUNNEL_LOG_ERROR(
        "Unexpected sink failure" << kv("sink", binding.name) << kv("error", e.what())
      );
    }
  }
  return written;
}

void Dispatcher::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  for (auto& entry : bindings_) {
    try {
      entry.second->sink->flush();
    } catch (const SinkWriteError& e) {
      FUNNEL_LOG_WARN("Sink flush failed" << kv("sink", entry.first) << kv("error", e.what()));
    }
  }
}

void Dispatcher::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;

  for (auto& entry : bindings_) {
    try {
      entry.second->sink->close();
    } catch (const std::exception& e) {
      FUNNEL_LOG_WARN("Sink close failed" << kv("sink", entry.first) << kv("error", e.what()));
    }
  }
  FUNNEL_LOG_DEBUG(
    "Sinks closed" << kv("lines", stats_.lines_written) << kv("failures", stats_.write_failures)
  );
}

bool Dispatcher::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

DispatchStats Dispatcher::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace pipeline
}  // namespace funnel
