// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "rotating_file_sink.hpp"

#include <boost/filesystem.hpp>

#include "funnel_errors.hpp"

namespace funnel {
namespace sinks {

namespace fs = boost::filesystem;

RotatingFileSink::RotatingFileSink(
  const std::string& path, const std::string& mode, const std::string& encoding,
  uint64_t max_bytes, int backup_count
)
    // A size-rotated file is always appended to
    : FileSink(path, max_bytes > 0 ? "a" : mode, encoding)
    , max_bytes_(max_bytes)
    , backup_count_(backup_count < 0 ? 0 : backup_count) {}

std::string RotatingFileSink::backup_name(int index) const {
  return path() + "." + std::to_string(index);
}

bool RotatingFileSink::should_rollover(const std::string& line) const {
  if (max_bytes_ == 0 || backup_count_ == 0 || size() == 0) {
    return false;
  }
  return size() + line.size() + 1 >= max_bytes_;
}

void RotatingFileSink::do_rollover() {
  close_stream();

  boost::system::error_code ec;
  for (int i = backup_count_ - 1; i >= 1; --i) {
    fs::path source(backup_name(i));
    if (fs::exists(source, ec)) {
      fs::rename(source, fs::path(backup_name(i + 1)), ec);
      if (ec) {
        throw SinkWriteError(
          "Cannot rename '" + source.string() + "' during rotation: " + ec.message()
        );
      }
    }
  }

  if (fs::exists(fs::path(path()), ec)) {
    fs::rename(fs::path(path()), fs::path(backup_name(1)), ec);
    if (ec) {
      throw SinkWriteError("Cannot rename '" + path() + "' during rotation: " + ec.message());
    }
  }

  reopen_truncated();
}

void RotatingFileSink::write(const std::string& line, severity_level level) {
  if (is_closed()) {
    throw SinkWriteError("File sink '" + path() + "' is closed");
  }
  if (!is_open()) {
    // An earlier rollover failed after closing the stream
    reopen_appending();
  }
  if (should_rollover(line)) {
    do_rollover();
  }
  FileSink::write(line, level);
}

}  // namespace sinks
}  // namespace funnel
