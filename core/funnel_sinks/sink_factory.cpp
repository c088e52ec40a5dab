// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "sink_factory.hpp"

#include <memory>
#include <utility>

#include "console_sink.hpp"
#include "file_sink.hpp"
#include "funnel_errors.hpp"
#include "rotating_file_sink.hpp"

#define FUNNEL_LOG_COMPONENT "sink_factory"
#include <funnel_log_macros.hpp>

namespace funnel {
namespace sinks {

SinkFactory::SinkFactory(std::ostream& out, std::ostream& err, Clock clock)
    : out_(&out)
    , err_(&err)
    , clock_(std::move(clock)) {}

std::unique_ptr<Sink> SinkFactory::build(
  config::SinkKind kind, const config::SinkConfig& config
) const {
  std::unique_ptr<Sink> sink;

  switch (kind) {
    case config::SinkKind::console:
      if (config.stream == "stdout") {
        sink = std::make_unique<ConsoleSink>(*out_, "stdout", config.colors);
      } else if (config.stream == "stderr") {
        sink = std::make_unique<ConsoleSink>(*err_, "stderr", config.colors);
      } else {
        throw SinkConstructionError(config.stream, "unknown console stream");
      }
      break;

    case config::SinkKind::file:
      sink = std::make_unique<FileSink>(config.filename, config.mode, config.encoding);
      break;

    case config::SinkKind::rotating_by_size:
      sink = std::make_unique<RotatingFileSink>(
        config.filename, config.mode, config.encoding, config.max_bytes, config.backup_count
      );
      break;

    case config::SinkKind::rotating_by_time:
      sink = std::make_unique<TimedRotatingFileSink>(
        config.filename, config.encoding, config.when, config.interval, config.backup_count,
        config.utc, clock_
      );
      break;

    default:
      throw SinkConstructionError(config.name, "unknown sink kind");
  }

  FUNNEL_LOG_DEBUG(
    "Sink built" << logging::kv("name", config.name) << logging::kv("kind", to_string(kind))
                 << logging::kv("target", sink->target())
  );
  return sink;
}

}  // namespace sinks
}  // namespace funnel
