// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "log_record.hpp"

#include <unistd.h>

#include <functional>
#include <thread>

namespace funnel {
namespace record {

bool operator==(const SourceLocation& a, const SourceLocation& b) {
  return a.file == b.file && a.line == b.line && a.function == b.function;
}

bool operator!=(const SourceLocation& a, const SourceLocation& b) {
  return !(a == b);
}

bool operator==(const LogRecord& a, const LogRecord& b) {
  return a.timestamp == b.timestamp && a.channel == b.channel && a.severity == b.severity &&
         a.message == b.message && a.location == b.location && a.process_id == b.process_id &&
         a.thread_id == b.thread_id;
}

bool operator!=(const LogRecord& a, const LogRecord& b) {
  return !(a == b);
}

uint64_t current_thread_id() {
  return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

LogRecord make_record(
  const std::string& channel, severity_level severity, const std::string& message,
  std::optional<SourceLocation> location
) {
  LogRecord record;
  record.timestamp = std::chrono::system_clock::now();
  record.channel = channel;
  record.severity = severity;
  record.message = message;
  record.location = std::move(location);
  record.process_id = static_cast<int64_t>(::getpid());
  record.thread_id = current_thread_id();
  return record;
}

}  // namespace record
}  // namespace funnel
