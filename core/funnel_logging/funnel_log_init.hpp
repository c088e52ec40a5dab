// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LOG_INIT_HPP
#define FUNNEL_LOG_INIT_HPP

#include <boost/smart_ptr/shared_ptr.hpp>

#include <optional>
#include <ostream>
#include <string>

#include "funnel_console_sink.hpp"
#include "funnel_log_severity.hpp"

namespace funnel {
namespace logging {

/**
 * Configuration of the diagnostics stream: the library's own output, used to
 * report failures that must not reach the caller (sink write errors, dropped
 * records, malformed frames from workers).
 */
struct DiagnosticsConfig {
  bool enabled = true;
  bool colors = false;
  severity_level level = severity_level::warning;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "critical", "fatal"
 * (case-insensitive)
 *
 * @param level_str The string representation of the level
 * @return The parsed severity_level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a DiagnosticsConfig.
 *
 * Supported environment variables:
 *   FUNNEL_DIAG_LEVEL    - Minimum diagnostics level
 *   FUNNEL_DIAG_ENABLED  - Enable diagnostics output ("true" or "false")
 *   FUNNEL_DIAG_COLORS   - Colored severity tags ("true" or "false")
 *
 * @param config The configuration to modify (in-place)
 */
void apply_env_overrides(DiagnosticsConfig& config);

/**
 * Initialize the diagnostics stream. Idempotent: the first call wins until
 * shutdown_diagnostics() is called. With config.enabled false every
 * diagnostic is discarded; nothing reaches stdout or std::clog.
 *
 * @param config Diagnostics configuration
 * @param stream Target stream; std::clog when null
 */
void init_diagnostics(
  const DiagnosticsConfig& config,
  boost::shared_ptr<std::ostream> stream = boost::shared_ptr<std::ostream>()
);

/**
 * Initialize with defaults (WARNING and above to std::clog) plus
 * environment overrides.
 */
void init_diagnostics_default();

/**
 * Remove the diagnostics sink from the logging core and flush it. Later
 * diagnostics are discarded until the next init_diagnostics().
 */
void shutdown_diagnostics();

/**
 * Flush the diagnostics sink.
 */
void flush_diagnostics();

/**
 * Check if diagnostics are initialized.
 */
bool is_diagnostics_initialized();

}  // namespace logging
}  // namespace funnel

#endif  // FUNNEL_LOG_INIT_HPP
