// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_SINKS_TIMED_ROTATING_FILE_SINK_HPP
#define FUNNEL_SINKS_TIMED_ROTATING_FILE_SINK_HPP

#include <chrono>
#include <ctime>
#include <functional>
#include <regex>
#include <string>
#include <vector>

#include "file_sink.hpp"

namespace funnel {
namespace sinks {

/**
 * Wall clock used for rotation decisions; replaceable in tests.
 */
typedef std::function<std::chrono::system_clock::time_point()> Clock;

Clock default_clock();

/**
 * File sink that rotates when the clock passes the next rollover instant.
 *
 * Units: "S", "M", "H", "D" (interval multiples of the unit), "midnight"
 * (every midnight) and "W0".."W6" (the midnight that ends the given weekday,
 * Monday = 0). The rotated file is renamed to path.<start of the interval>
 * using a unit-specific strftime suffix; backups beyond backup_count are
 * deleted, oldest first.
 */
class TimedRotatingFileSink : public FileSink {
public:
  /**
   * @throws SinkConstructionError on an unknown unit or non-positive interval
   */
  TimedRotatingFileSink(
    const std::string& path, const std::string& encoding, const std::string& when, int interval,
    int backup_count, bool utc, Clock clock = default_clock()
  );

  void write(const std::string& line, severity_level level) override;

  std::chrono::system_clock::time_point next_rollover() const {
    return std::chrono::system_clock::from_time_t(rollover_at_);
  }

  const std::string& suffix_format() const {
    return suffix_;
  }

  /**
   * Backup files currently on disk, oldest first.
   */
  std::vector<std::string> existing_backups() const;

private:
  std::time_t compute_rollover(std::time_t now) const;
  void do_rollover(std::time_t now);
  std::string format_suffix(std::time_t t) const;
  bool matches_suffix(const std::string& suffix) const;

  std::string when_;
  long interval_seconds_ = 0;
  int day_of_week_ = -1;  // 0 = Monday, only for "Wn"
  int backup_count_;
  bool utc_;
  Clock clock_;
  std::string suffix_;
  std::string suffix_pattern_;
  std::regex suffix_regex_;
  std::time_t rollover_at_ = 0;
};

}  // namespace sinks
}  // namespace funnel

#endif  // FUNNEL_SINKS_TIMED_ROTATING_FILE_SINK_HPP
