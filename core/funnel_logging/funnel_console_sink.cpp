// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "funnel_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

namespace funnel {
namespace logging {

namespace expr = boost::log::expressions;

// Color codes for terminal output
const char* get_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";  // Cyan
    case severity_level::info:
      return "\033[32m";  // Green
    case severity_level::warning:
      return "\033[33m";  // Yellow
    case severity_level::error:
      return "\033[31m";  // Red
    case severity_level::critical:
      return "\033[35m";  // Magenta
    default:
      return "";
  }
}

const char* get_reset_color() {
  return "\033[0m";
}

boost::shared_ptr<console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors, boost::shared_ptr<std::ostream> stream
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  if (stream) {
    backend->add_stream(stream);
  } else {
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  }
  backend->auto_flush(true);

  auto sink = boost::make_shared<console_sink_t>(backend);

  sink->set_filter(severity >= min_level);

  sink->set_formatter(
    [use_colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      // Timestamp
      strm << "[";
      auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
      if (time_stamp) {
        strm << *time_stamp;
      }
      strm << "] ";

      // Process id, owner and workers may share one terminal
      auto pid = boost::log::extract<boost::log::attributes::current_process_id::value_type>(
        "ProcessID", rec
      );
      if (pid) {
        strm << "[pid " << pid->native_id() << "] ";
      }

      // Severity, colored when requested
      auto sev = boost::log::extract<severity_level>("Severity", rec);
      if (sev) {
        if (use_colors) {
          strm << get_color(*sev) << "[" << *sev << "]" << get_reset_color() << " ";
        } else {
          strm << "[" << *sev << "] ";
        }
      }

      strm << rec[expr::smessage];
    }
  );

  return sink;
}

}  // namespace logging
}  // namespace funnel
