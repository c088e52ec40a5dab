// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LOG_RECORD_HPP
#define FUNNEL_LOG_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "funnel_log_severity.hpp"

namespace funnel {
namespace record {

using logging::severity_level;

/**
 * Where a record was produced.
 */
struct SourceLocation {
  std::string file;      // Path as given by __FILE__
  int line = 0;          // Line number
  std::string function;  // Function name, may be empty
};

bool operator==(const SourceLocation& a, const SourceLocation& b);
bool operator!=(const SourceLocation& a, const SourceLocation& b);

/**
 * One log record. Created at the call site and passed by const reference
 * from there on; never mutated after make_record().
 */
struct LogRecord {
  std::chrono::system_clock::time_point timestamp;
  std::string channel;  // Dotted channel name, "" for the root
  severity_level severity = severity_level::info;
  std::string message;
  std::optional<SourceLocation> location;
  int64_t process_id = 0;
  uint64_t thread_id = 0;
};

bool operator==(const LogRecord& a, const LogRecord& b);
bool operator!=(const LogRecord& a, const LogRecord& b);

/**
 * Build a record stamped with the current time, process and thread.
 */
LogRecord make_record(
  const std::string& channel, severity_level severity, const std::string& message,
  std::optional<SourceLocation> location = std::nullopt
);

/**
 * Numeric id of the calling thread (stable for the thread's lifetime).
 */
uint64_t current_thread_id();

}  // namespace record
}  // namespace funnel

#endif  // FUNNEL_LOG_RECORD_HPP
