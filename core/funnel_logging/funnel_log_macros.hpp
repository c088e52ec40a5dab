// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LOG_MACROS_HPP
#define FUNNEL_LOG_MACROS_HPP

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "funnel_log_severity.hpp"

namespace funnel {
namespace logging {

// Global severity logger type used for the library's own diagnostics
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the diagnostics logger instance.
 * Defined in funnel_log_init.cpp
 */
logger_type& get_logger();

/**
 * Simple key-value formatter for diagnostics messages.
 * Usage: FUNNEL_LOG_WARN("message" << kv("key", value));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

// Specialization for std::string to add quotes
template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

// Overload for const char* to add quotes
inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace funnel

// =============================================================================
// Component identification
// Define FUNNEL_LOG_COMPONENT before including this header:
//
//   #define FUNNEL_LOG_COMPONENT "collector"
//   #include <funnel_log_macros.hpp>
// =============================================================================
#ifndef FUNNEL_LOG_COMPONENT
#define FUNNEL_LOG_COMPONENT "funnel"
#endif

// In release builds (NDEBUG defined), DEBUG diagnostics are compiled out
#ifdef NDEBUG
#define FUNNEL_LOG_ENABLE_DEBUG 0
#else
#define FUNNEL_LOG_ENABLE_DEBUG 1
#endif

// =============================================================================
// Diagnostics macros - stream-based API
// Usage: FUNNEL_LOG_ERROR("Sink write failed" << kv("sink", name));
// =============================================================================

#define FUNNEL_LOG_DEBUG(msg) \
  do { \
    if (FUNNEL_LOG_ENABLE_DEBUG) { \
      BOOST_LOG_SEV(::funnel::logging::get_logger(), ::funnel::logging::severity_level::debug) \
        << "[" << FUNNEL_LOG_COMPONENT << "] " << msg; \
    } \
  } while (0)

#define FUNNEL_LOG_INFO(msg) \
  do { \
    BOOST_LOG_SEV(::funnel::logging::get_logger(), ::funnel::logging::severity_level::info) \
      << "[" << FUNNEL_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define FUNNEL_LOG_WARN(msg) \
  do { \
    BOOST_LOG_SEV(::funnel::logging::get_logger(), ::funnel::logging::severity_level::warning) \
      << "[" << FUNNEL_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define FUNNEL_LOG_ERROR(msg) \
  do { \
    BOOST_LOG_SEV(::funnel::logging::get_logger(), ::funnel::logging::severity_level::error) \
      << "[" << FUNNEL_LOG_COMPONENT << "] " << msg; \
  } while (0)

#endif  // FUNNEL_LOG_MACROS_HPP
