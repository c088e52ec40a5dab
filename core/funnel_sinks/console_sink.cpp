// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "console_sink.hpp"

#include <utility>

#include "funnel_console_sink.hpp"
#include "funnel_errors.hpp"

namespace funnel {
namespace sinks {

ConsoleSink::ConsoleSink(std::ostream& stream, std::string name, bool use_colors)
    : stream_(&stream)
    , name_(std::move(name))
    , use_colors_(use_colors) {}

void ConsoleSink::write(const std::string& line, severity_level level) {
  if (closed_) {
    throw SinkWriteError("Console sink '" + name_ + "' is closed");
  }
  if (use_colors_) {
    *stream_ << logging::get_color(level) << line << logging::get_reset_color() << '\n';
  } else {
    *stream_ << line << '\n';
  }
  stream_->flush();
  if (!stream_->good()) {
    stream_->clear();
    throw SinkWriteError("Failed to write to " + name_);
  }
}

void ConsoleSink::flush() {
  if (!closed_) {
    stream_->flush();
  }
}

void ConsoleSink::close() {
  if (!closed_) {
    stream_->flush();
    closed_ = true;
  }
}

}  // namespace sinks
}  // namespace funnel
