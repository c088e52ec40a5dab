// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_SINK_HPP
#define FUNNEL_SINK_HPP

#include <string>

#include "funnel_log_severity.hpp"

namespace funnel {
namespace sinks {

using logging::severity_level;

/**
 * Terminal destination for formatted log lines.
 *
 * A sink is not thread-safe on its own: in standalone and owner mode every
 * call is made by the dispatcher under its lock.
 */
class Sink {
public:
  virtual ~Sink() = default;

  /**
   * Write one formatted line. The sink appends the line terminator.
   * @throws SinkWriteError if the line could not be persisted
   */
  virtual void write(const std::string& line, severity_level level) = 0;

  virtual void flush() {}

  /**
   * Release the underlying resource. Idempotent.
   */
  virtual void close() = 0;

  /**
   * Human-readable target, e.g. the file path or "stderr".
   */
  virtual std::string target() const = 0;
};

}  // namespace sinks
}  // namespace funnel

#endif  // FUNNEL_SINK_HPP
