// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "timed_rotating_file_sink.hpp"

#include <boost/filesystem.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

#include "funnel_errors.hpp"

#define FUNNEL_LOG_COMPONENT "timed_rotating_sink"
#include <funnel_log_macros.hpp>

namespace funnel {
namespace sinks {

namespace fs = boost::filesystem;

namespace {

constexpr long kSecondsPerDay = 24 * 60 * 60;

std::string to_upper(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return std::toupper(c);
  });
  return result;
}

}  // namespace

Clock default_clock() {
  return []() {
    return std::chrono::system_clock::now();
  };
}

TimedRotatingFileSink::TimedRotatingFileSink(
  const std::string& path, const std::string& encoding, const std::string& when, int interval,
  int backup_count, bool utc, Clock clock
)
    : FileSink(path, "a", encoding)
    , when_(to_upper(when))
    , backup_count_(backup_count < 0 ? 0 : backup_count)
    , utc_(utc)
    , clock_(clock ? std::move(clock) : default_clock()) {
  if (interval <= 0) {
    throw SinkConstructionError(path, "rotation interval must be positive");
  }

  if (when_ == "S") {
    interval_seconds_ = 1;
    suffix_ = "%Y-%m-%d_%H-%M-%S";
    suffix_pattern_ = R"(^\d{4}-\d{2}-\d{2}_\d{2}-\d{2}-\d{2}$)";
  } else if (when_ == "M") {
    interval_seconds_ = 60;
    suffix_ = "%Y-%m-%d_%H-%M";
    suffix_pattern_ = R"(^\d{4}-\d{2}-\d{2}_\d{2}-\d{2}$)";
  } else if (when_ == "H") {
    interval_seconds_ = 60 * 60;
    suffix_ = "%Y-%m-%d_%H";
    suffix_pattern_ = R"(^\d{4}-\d{2}-\d{2}_\d{2}$)";
  } else if (when_ == "D" || when_ == "MIDNIGHT") {
    interval_seconds_ = kSecondsPerDay;
    suffix_ = "%Y-%m-%d";
    suffix_pattern_ = R"(^\d{4}-\d{2}-\d{2}$)";
  } else if (when_.size() == 2 && when_[0] == 'W' && when_[1] >= '0' && when_[1] <= '6') {
    interval_seconds_ = 7 * kSecondsPerDay;
    day_of_week_ = when_[1] - '0';
    suffix_ = "%Y-%m-%d";
    suffix_pattern_ = R"(^\d{4}-\d{2}-\d{2}$)";
  } else {
    throw SinkConstructionError(path, "unknown rotation unit '" + when + "'");
  }
  interval_seconds_ *= interval;
  suffix_regex_ = std::regex(suffix_pattern_);

  std::time_t start = std::chrono::system_clock::to_time_t(clock_());
  if (initial_mtime()) {
    start = std::chrono::system_clock::to_time_t(*initial_mtime());
  }
  rollover_at_ = compute_rollover(start);
}

std::time_t TimedRotatingFileSink::compute_rollover(std::time_t now) const {
  std::time_t result = now + interval_seconds_;
  if (when_ != "MIDNIGHT" && day_of_week_ < 0) {
    return result;
  }

  std::tm tm_buf{};
  if (utc_) {
    gmtime_r(&now, &tm_buf);
  } else {
    localtime_r(&now, &tm_buf);
  }
  long since_midnight = tm_buf.tm_hour * 3600L + tm_buf.tm_min * 60L + tm_buf.tm_sec;
  result = now - since_midnight + kSecondsPerDay;

  if (day_of_week_ >= 0) {
    // tm_wday counts from Sunday; convert to Monday = 0
    int day = (tm_buf.tm_wday + 6) % 7;
    if (day != day_of_week_) {
      int days_to_wait =
        day < day_of_week_ ? day_of_week_ - day : 6 - day + day_of_week_ + 1;
      result += days_to_wait * kSecondsPerDay;
    }
  }
  return result;
}

std::string TimedRotatingFileSink::format_suffix(std::time_t t) const {
  std::tm tm_buf{};
  if (utc_) {
    gmtime_r(&t, &tm_buf);
  } else {
    localtime_r(&t, &tm_buf);
  }
  char buf[64];
  size_t written = std::strftime(buf, sizeof(buf), suffix_.c_str(), &tm_buf);
  return std::string(buf, written);
}

bool TimedRotatingFileSink::matches_suffix(const std::string& suffix) const {
  return std::regex_match(suffix, suffix_regex_);
}

std::vector<std::string> TimedRotatingFileSink::existing_backups() const {
  std::vector<std::string> backups;
  fs::path file_path(path());
  fs::path dir = file_path.parent_path();
  if (dir.empty()) {
    dir = fs::current_path();
  }
  const std::string prefix = file_path.filename().string() + ".";

  boost::system::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0 &&
        matches_suffix(name.substr(prefix.size()))) {
      backups.push_back((dir / name).string());
    }
  }
  // Suffixes sort chronologically
  std::sort(backups.begin(), backups.end());
  return backups;
}

void TimedRotatingFileSink::do_rollover(std::time_t now) {
  close_stream();

  std::string target = path() + "." + format_suffix(rollover_at_ - interval_seconds_);
  boost::system::error_code ec;
  // rename() replaces an existing target
  if (fs::exists(fs::path(path()), ec)) {
    fs::rename(fs::path(path()), fs::path(target), ec);
    if (ec) {
      throw SinkWriteError("Cannot rename '" + path() + "' during rotation: " + ec.message());
    }
  }

  if (backup_count_ > 0) {
    auto backups = existing_backups();
    if (backups.size() > static_cast<size_t>(backup_count_)) {
      size_t excess = backups.size() - static_cast<size_t>(backup_count_);
      for (size_t i = 0; i < excess; ++i) {
        fs::remove(fs::path(backups[i]), ec);
        if (ec) {
          FUNNEL_LOG_WARN(
            "Cannot delete old backup" << logging::kv("file", backups[i])
                                       << logging::kv("error", ec.message())
          );
        }
      }
    }
  }

  reopen_truncated();

  std::time_t next = compute_rollover(now);
  while (next <= now) {
    next += interval_seconds_;
  }
  rollover_at_ = next;
}

void TimedRotatingFileSink::write(const std::string& line, severity_level level) {
  if (is_closed()) {
    throw SinkWriteError("File sink '" + path() + "' is closed");
  }
  if (!is_open()) {
    // An earlier rollover failed after closing the stream
    reopen_appending();
  }
  std::time_t now = std::chrono::system_clock::to_time_t(clock_());
  if (now >= rollover_at_) {
    do_rollover(now);
  }
  FileSink::write(line, level);
}

}  // namespace sinks
}  // namespace funnel
