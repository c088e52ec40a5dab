// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_CONSOLE_SINK_HPP
#define FUNNEL_CONSOLE_SINK_HPP

#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <ostream>

#include "funnel_log_severity.hpp"

namespace funnel {
namespace logging {

/**
 * Synchronous console sink for diagnostics.
 * The diagnostics stream is the fallback for failures inside the routing
 * pipeline, so records are written before the reporting call returns.
 */
typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>
  console_sink_t;

/**
 * Create the diagnostics console sink.
 *
 * @param min_level Minimum severity level to log
 * @param use_colors Whether to use ANSI color codes
 * @param stream Target stream; std::clog when null
 * @return Shared pointer to the sink
 */
boost::shared_ptr<console_sink_t> create_console_sink(
  severity_level min_level = severity_level::warning, bool use_colors = false,
  boost::shared_ptr<std::ostream> stream = boost::shared_ptr<std::ostream>()
);

/**
 * ANSI color escape for a severity level ("" for unknown levels).
 */
const char* get_color(severity_level level);

const char* get_reset_color();

}  // namespace logging
}  // namespace funnel

#endif  // FUNNEL_CONSOLE_SINK_HPP
