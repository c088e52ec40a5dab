// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_RECORD_FORMATTER_HPP
#define FUNNEL_RECORD_FORMATTER_HPP

#include <string>
#include <vector>

#include "log_record.hpp"

namespace funnel {
namespace record {

/**
 * Renders a LogRecord into one line of text from a %-style template.
 *
 * Supported fields:
 *   %(name)s %(levelname)s %(levelno)d %(message)s %(asctime)s %(msecs)d
 *   %(created)f %(filename)s %(pathname)s %(module)s %(lineno)d
 *   %(funcName)s %(process)d %(thread)d
 * Each field may carry flags ('-' left align, '0' zero pad), a width and a
 * precision, e.g. "%(levelname)-8s" or "%(msecs)03d". "%%" is a literal '%'.
 *
 * The template is parsed once at construction; format() is const and may be
 * called concurrently.
 */
class RecordFormatter {
public:
  static const char* const kDefaultFormat;      // "%(asctime)s - %(name)s - %(levelname)s - %(message)s"
  static const char* const kDefaultDateFormat;  // "%Y-%m-%d %H:%M:%S"

  RecordFormatter();

  /**
   * @param format Line template
   * @param datefmt strftime pattern for %(asctime)s; empty selects the default
   * @param utc Render %(asctime)s in UTC instead of local time
   * @throws std::invalid_argument on an unknown field or malformed directive
   */
  RecordFormatter(const std::string& format, const std::string& datefmt, bool utc = false);

  std::string format(const LogRecord& record) const;

  /**
   * Timestamp rendered with the configured date format.
   */
  std::string format_time(const LogRecord& record) const;

  const std::string& pattern() const {
    return pattern_;
  }

  const std::string& date_format() const {
    return datefmt_;
  }

private:
  enum class Field {
    literal,
    name,
    levelname,
    levelno,
    message,
    asctime,
    created,
    msecs,
    filename,
    pathname,
    module,
    lineno,
    func_name,
    process,
    thread
  };

  struct Segment {
    Field field = Field::literal;
    std::string text;  // literal text, or the field key for diagnostics
    bool left_align = false;
    bool zero_pad = false;
    int width = 0;
    int precision = -1;
    char conversion = 's';
  };

  void parse(const std::string& format);
  std::string render(const Segment& segment, const LogRecord& record) const;

  std::string pattern_;
  std::string datefmt_;
  bool utc_ = false;
  std::vector<Segment> segments_;
};

}  // namespace record
}  // namespace funnel

#endif  // FUNNEL_RECORD_FORMATTER_HPP
