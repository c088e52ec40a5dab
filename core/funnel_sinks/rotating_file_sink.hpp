// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_SINKS_ROTATING_FILE_SINK_HPP
#define FUNNEL_SINKS_ROTATING_FILE_SINK_HPP

#include <cstdint>
#include <string>

#include "file_sink.hpp"

namespace funnel {
namespace sinks {

/**
 * File sink that rotates by size.
 *
 * Before a line that would make the file reach max_bytes, the backups are
 * shifted (path.N-1 -> path.N ... path -> path.1, the oldest overwritten) and
 * a fresh file is opened. Rotation only happens between lines and never on an
 * empty file, so an oversized line is written whole.
 * max_bytes == 0 or backup_count == 0 disables rotation.
 */
class RotatingFileSink : public FileSink {
public:
  RotatingFileSink(
    const std::string& path, const std::string& mode, const std::string& encoding,
    uint64_t max_bytes, int backup_count
  );

  void write(const std::string& line, severity_level level) override;

  uint64_t max_bytes() const {
    return max_bytes_;
  }

  int backup_count() const {
    return backup_count_;
  }

  /**
   * Name of the i-th backup (1 is the most recent).
   */
  std::string backup_name(int index) const;

private:
  bool should_rollover(const std::string& line) const;
  void do_rollover();

  uint64_t max_bytes_;
  int backup_count_;
};

}  // namespace sinks
}  // namespace funnel

#endif  // FUNNEL_SINKS_ROTATING_FILE_SINK_HPP
