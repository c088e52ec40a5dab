// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_SINKS_CONSOLE_SINK_HPP
#define FUNNEL_SINKS_CONSOLE_SINK_HPP

#include <ostream>
#include <string>

#include "sink.hpp"

namespace funnel {
namespace sinks {

/**
 * Writes lines to a borrowed stream (std::cerr or std::cout).
 * close() flushes but never closes the stream.
 */
class ConsoleSink : public Sink {
public:
  ConsoleSink(std::ostream& stream, std::string name, bool use_colors = false);

  void write(const std::string& line, severity_level level) override;
  void flush() override;
  void close() override;
  std::string target() const override {
    return name_;
  }

private:
  std::ostream* stream_;
  std::string name_;
  bool use_colors_;
  bool closed_ = false;
};

}  // namespace sinks
}  // namespace funnel

#endif  // FUNNEL_SINKS_CONSOLE_SINK_HPP
