// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LOG_SEVERITY_HPP
#define FUNNEL_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <ostream>

namespace funnel {
namespace logging {

/**
 * Severity levels shared by routed records and the library's own diagnostics.
 * Ordered: debug < info < warning < error < critical.
 */
enum class severity_level { debug = 0, info = 1, warning = 2, error = 3, critical = 4 };

inline const char* severity_name(severity_level level) {
  static const char* strings[] = {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};
  if (static_cast<size_t>(level) < sizeof(strings) / sizeof(*strings)) {
    return strings[static_cast<size_t>(level)];
  }
  return "UNKNOWN";
}

// Numeric value used by %(levelno)d: DEBUG=10 ... CRITICAL=50
inline int severity_number(severity_level level) {
  return (static_cast<int>(level) + 1) * 10;
}

// Output operator for formatting
inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  if (static_cast<size_t>(level) <= static_cast<size_t>(severity_level::critical))
    strm << severity_name(level);
  else
    strm << static_cast<int>(level);
  return strm;
}

// Boost.Log keyword for severity filtering
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace funnel

#endif  // FUNNEL_LOG_SEVERITY_HPP
