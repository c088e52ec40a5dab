// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "logging_config.hpp"

namespace funnel {
namespace config {

std::optional<SinkKind> parse_sink_kind(const std::string& tag) {
  if (tag == "stream" || tag == "console") {
    return SinkKind::console;
  }
  if (tag == "file") {
    return SinkKind::file;
  }
  if (tag == "rotating_file" || tag == "rotating-by-size") {
    return SinkKind::rotating_by_size;
  }
  if (tag == "timed_rotating_file" || tag == "rotating-by-time") {
    return SinkKind::rotating_by_time;
  }
  return std::nullopt;
}

const char* to_string(SinkKind kind) {
  switch (kind) {
    case SinkKind::console:
      return "console";
    case SinkKind::file:
      return "file";
    case SinkKind::rotating_by_size:
      return "rotating-by-size";
    case SinkKind::rotating_by_time:
      return "rotating-by-time";
    default:
      return "unknown";
  }
}

std::optional<OverflowPolicy> parse_overflow_policy(const std::string& tag) {
  if (tag == "block") {
    return OverflowPolicy::block;
  }
  if (tag == "drop") {
    return OverflowPolicy::drop;
  }
  return std::nullopt;
}

const char* to_string(OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::block:
      return "block";
    case OverflowPolicy::drop:
      return "drop";
    default:
      return "unknown";
  }
}

const SinkConfig* LoggingConfig::find_handler(const std::string& name) const {
  for (const auto& handler : handlers) {
    if (handler.name == name) {
      return &handler;
    }
  }
  return nullptr;
}

std::vector<std::string> LoggingConfig::root_handlers() const {
  if (root.handlers_given) {
    return root.handlers;
  }
  std::vector<std::string> names;
  names.reserve(handlers.size());
  for (const auto& handler : handlers) {
    names.push_back(handler.name);
  }
  return names;
}

}  // namespace config
}  // namespace funnel
