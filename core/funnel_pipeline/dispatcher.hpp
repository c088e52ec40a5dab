// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_DISPATCHER_HPP
#define FUNNEL_DISPATCHER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "channel_registry.hpp"
#include "log_record.hpp"
#include "logging_config.hpp"
#include "record_formatter.hpp"
#include "sink.hpp"
#include "sink_factory.hpp"

namespace funnel {
namespace pipeline {

/**
 * A configured sink that could not be built.
 */
struct SinkFailure {
  std::string sink;    // Handler name from the configuration
  std::string path;    // Target that failed, e.g. the file path
  std::string reason;
};

struct DispatchStats {
  uint64_t records = 0;         // Records offered to dispatch()
  uint64_t lines_written = 0;   // Successful Sink::write calls
  uint64_t write_failures = 0;  // Sink::write calls that threw
};

/**
 * Owns the sinks of a standalone or owner process and fans records out to
 * them.
 *
 * Every configured handler is built once at construction. A handler that
 * fails to build is recorded and skipped; the rest still work. dispatch()
 * serializes all sink writes on one mutex, so whoever calls it (the caller
 * thread in standalone mode, the collector or the owner's own emits) is the
 * single writer at that moment.
 */
class Dispatcher {
public:
  Dispatcher(
    const config::LoggingConfig& config, std::shared_ptr<ChannelRegistry> registry,
    const sinks::SinkFactory& factory
  );

  /**
   * Destructor - closes the sinks if close() was not called
   */
  ~Dispatcher();

  // Non-copyable, non-movable
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  /**
   * Route a record through the channel hierarchy and write it to every sink
   * whose level admits it. Channel-level filtering is the caller's job.
   *
   * Sink write failures are reported on the diagnostics stream and counted;
   * they never propagate.
   *
   * @return Number of sinks that accepted the line
   */
  size_t dispatch(const record::LogRecord& record);

  void flush();

  /**
   * Close every sink exactly once. Later dispatch() calls write nothing.
   */
  void close();

  bool is_closed() const;

  const std::vector<SinkFailure>& failures() const {
    return failures_;
  }

  size_t sink_count() const {
    return bindings_.size();
  }

  bool has_sink(const std::string& name) const {
    return bindings_.find(name) != bindings_.end();
  }

  DispatchStats stats() const;

private:
  struct Binding {
    std::string name;
    severity_level level;
    record::RecordFormatter formatter;
    std::unique_ptr<sinks::Sink> sink;
  };

  void build_binding(const config::SinkConfig& sink_config, const sinks::SinkFactory& factory);

  std::shared_ptr<ChannelRegistry> registry_;
  std::map<std::string, std::unique_ptr<Binding>> bindings_;
  std::vector<SinkFailure> failures_;

  mutable std::mutex mutex_;
  bool closed_ = false;
  DispatchStats stats_;
};

}  // namespace pipeline
}  // namespace funnel

#endif  // FUNNEL_DISPATCHER_HPP
