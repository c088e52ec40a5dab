// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LOGGING_CONFIG_HPP
#define FUNNEL_LOGGING_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "funnel_log_init.hpp"
#include "funnel_log_severity.hpp"

namespace funnel {
namespace config {

using logging::severity_level;

/**
 * Concrete sink kinds the SinkFactory can build.
 */
enum class SinkKind { console, file, rotating_by_size, rotating_by_time };

/**
 * Parse a handler type tag.
 * Accepts: "stream", "console", "file", "rotating_file", "rotating-by-size",
 * "timed_rotating_file", "rotating-by-time"
 */
std::optional<SinkKind> parse_sink_kind(const std::string& tag);

const char* to_string(SinkKind kind);

/**
 * Behaviour of a bounded RecordChannel when it is full.
 */
enum class OverflowPolicy {
  block,  // Producer waits for space (backpressure)
  drop    // Record is refused and counted
};

std::optional<OverflowPolicy> parse_overflow_policy(const std::string& tag);

const char* to_string(OverflowPolicy policy);

constexpr int64_t kUnboundedQueue = -1;

struct FormatterConfig {
  std::string format = "%(asctime)s - %(name)s - %(levelname)s - %(message)s";
  std::string datefmt = "%Y-%m-%d %H:%M:%S";
};

/**
 * One entry of the `handlers:` section.
 * Kind-specific fields keep their defaults when unused.
 */
struct SinkConfig {
  std::string name;
  SinkKind kind = SinkKind::console;
  severity_level level = severity_level::info;
  FormatterConfig formatter;

  // console
  std::string stream = "stderr";
  bool colors = false;

  // file and rotating
  std::string filename = "app.log";
  std::string mode = "a";
  std::string encoding = "utf-8";

  // rotating_by_size
  uint64_t max_bytes = 10485760;

  // rotating_by_size and rotating_by_time
  int backup_count = 5;

  // rotating_by_time
  std::string when = "midnight";
  int interval = 1;
  bool utc = false;
};

/**
 * One entry of the `loggers:` section.
 */
struct ChannelConfig {
  std::optional<severity_level> level;
  bool propagate = true;
  std::vector<std::string> handlers;
};

struct RootConfig {
  severity_level level = severity_level::warning;
  bool level_given = false;  // false: get_channel("", level) may replace it
  bool propagate = false;
  std::vector<std::string> handlers;
  bool handlers_given = false;  // false: every configured handler is attached
};

/**
 * Owner-side RecordChannel and socket settings (`multiprocess:` section).
 */
struct ChannelSettings {
  int64_t queue_size = kUnboundedQueue;
  OverflowPolicy overflow = OverflowPolicy::block;
  std::string socket_dir;  // empty: system temp directory
  std::chrono::milliseconds drain_timeout{2000};
};

/**
 * Complete logging configuration. Loaded once, read-only afterwards.
 */
struct LoggingConfig {
  RootConfig root;
  std::map<std::string, ChannelConfig> loggers;
  std::vector<SinkConfig> handlers;  // in file order
  ChannelSettings multiprocess;
  logging::DiagnosticsConfig diagnostics;

  const SinkConfig* find_handler(const std::string& name) const;

  /**
   * Handler names attached to the root channel.
   */
  std::vector<std::string> root_handlers() const;
};

}  // namespace config
}  // namespace funnel

#endif  // FUNNEL_LOGGING_CONFIG_HPP
