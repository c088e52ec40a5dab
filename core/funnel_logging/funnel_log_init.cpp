// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "funnel_log_init.hpp"

#include <boost/log/attributes/attribute_value_set.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "funnel_log_macros.hpp"

namespace funnel {
namespace logging {

namespace {
// Thread safety for sink management
std::mutex g_sink_mutex;

boost::shared_ptr<console_sink_t> g_console_sink;

// Attached whenever the console sink is not. The logging core prints to
// stdout through its built-in default sink while it has no sinks at all.
boost::shared_ptr<console_sink_t> g_discard_sink;

void attach_discard_sink_locked() {
  if (g_discard_sink) {
    return;
  }
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  g_discard_sink = boost::make_shared<console_sink_t>(backend);
  g_discard_sink->set_filter([](boost::log::attribute_value_set const&) {
    return false;
  });
  boost::log::core::get()->add_sink(g_discard_sink);
}

void detach_discard_sink_locked() {
  if (g_discard_sink) {
    boost::log::core::get()->remove_sink(g_discard_sink);
    g_discard_sink.reset();
  }
}

bool attach_discard_sink_if_uninitialized() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (!g_console_sink) {
    attach_discard_sink_locked();
  }
  return true;
}

// Global logger instance (Meyers singleton). Records logged before
// init_diagnostics() are discarded.
logger_type& get_logger_impl() {
  static const bool discard_ready = attach_discard_sink_if_uninitialized();
  static logger_type instance;
  (void)discard_ready;
  return instance;
}

bool g_initialized = false;

std::string to_lower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return result;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

bool parse_bool(const std::string& s, bool default_value) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return default_value;
}
}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);

  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warning;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "critical" || lower == "fatal") {
    return severity_level::critical;
  }

  return std::nullopt;
}

void apply_env_overrides(DiagnosticsConfig& config) {
  if (auto level_str = get_env("FUNNEL_DIAG_LEVEL")) {
    if (auto level = parse_severity_level(*level_str)) {
      config.level = *level;
    }
  }

  if (auto enabled_str = get_env("FUNNEL_DIAG_ENABLED")) {
    config.enabled = parse_bool(*enabled_str, config.enabled);
  }

  if (auto colors_str = get_env("FUNNEL_DIAG_COLORS")) {
    config.colors = parse_bool(*colors_str, config.colors);
  }
}

logger_type& get_logger() {
  return get_logger_impl();
}

void init_diagnostics(const DiagnosticsConfig& config, boost::shared_ptr<std::ostream> stream) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);

  if (g_initialized) {
    return;
  }

  auto core = boost::log::core::get();

  // Add common attributes (TimeStamp, ThreadID, etc.)
  boost::log::add_common_attributes();

  if (config.enabled) {
    detach_discard_sink_locked();
    g_console_sink = create_console_sink(config.level, config.colors, stream);
    core->add_sink(g_console_sink);
  } else {
    attach_discard_sink_locked();
  }

  g_initialized = true;
}

void init_diagnostics_default() {
  DiagnosticsConfig config;
  apply_env_overrides(config);
  init_diagnostics(config);
}

void shutdown_diagnostics() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);

  if (!g_initialized) {
    return;
  }

  if (g_console_sink) {
    g_console_sink->flush();
    boost::log::core::get()->remove_sink(g_console_sink);
    g_console_sink.reset();
  }
  attach_discard_sink_locked();

  g_initialized = false;
}

void flush_diagnostics() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);

  if (g_console_sink) {
    g_console_sink->flush();
  }
}

bool is_diagnostics_initialized() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  return g_initialized;
}

}  // namespace logging
}  // namespace funnel
