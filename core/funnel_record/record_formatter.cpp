// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "record_formatter.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <unordered_map>

namespace funnel {
namespace record {

const char* const RecordFormatter::kDefaultFormat =
  "%(asctime)s - %(name)s - %(levelname)s - %(message)s";
const char* const RecordFormatter::kDefaultDateFormat = "%Y-%m-%d %H:%M:%S";

namespace {

const char* const kUnknownFile = "(unknown file)";
const char* const kUnknownFunction = "(unknown function)";

bool is_numeric_field(const std::string& key) {
  return key == "levelno" || key == "lineno" || key == "process" || key == "thread" ||
         key == "msecs" || key == "created";
}

std::string basename_of(const std::string& path) {
  auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string module_of(const std::string& path) {
  std::string base = basename_of(path);
  auto dot = base.find_last_of('.');
  return dot == std::string::npos || dot == 0 ? base : base.substr(0, dot);
}

std::string format_integer(long long value, int precision) {
  char buf[64];
  if (precision >= 0) {
    std::snprintf(buf, sizeof(buf), "%.*lld", precision, value);
  } else {
    std::snprintf(buf, sizeof(buf), "%lld", value);
  }
  return buf;
}

std::string format_double(double value, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision < 0 ? 6 : precision, value);
  return buf;
}

}  // namespace

RecordFormatter::RecordFormatter()
    : RecordFormatter(kDefaultFormat, kDefaultDateFormat) {}

RecordFormatter::RecordFormatter(
  const std::string& format, const std::string& datefmt, bool utc
)
    : pattern_(format)
    , datefmt_(datefmt.empty() ? kDefaultDateFormat : datefmt)
    , utc_(utc) {
  parse(pattern_);
}

void RecordFormatter::parse(const std::string& format) {
  static const std::unordered_map<std::string, Field> kFields = {
    {"name", Field::name},
    {"levelname", Field::levelname},
    {"levelno", Field::levelno},
    {"message", Field::message},
    {"asctime", Field::asctime},
    {"created", Field::created},
    {"msecs", Field::msecs},
    {"filename", Field::filename},
    {"pathname", Field::pathname},
    {"module", Field::module},
    {"lineno", Field::lineno},
    {"funcName", Field::func_name},
    {"process", Field::process},
    {"thread", Field::thread},
  };

  std::string literal;
  auto flush_literal = [&]() {
    if (!literal.empty()) {
      Segment seg;
      seg.text = literal;
      segments_.push_back(seg);
      literal.clear();
    }
  };

  size_t i = 0;
  const size_t n = format.size();
  while (i < n) {
    char c = format[i];
    if (c != '%') {
      literal.push_back(c);
      ++i;
      continue;
    }
    if (i + 1 >= n) {
      throw std::invalid_argument("Incomplete format directive at end of '" + format + "'");
    }
    if (format[i + 1] == '%') {
      literal.push_back('%');
      i += 2;
      continue;
    }
    if (format[i + 1] != '(') {
      throw std::invalid_argument(
        "Unsupported format directive '%" + std::string(1, format[i + 1]) + "' in '" + format +
        "'"
      );
    }

    auto close = format.find(')', i + 2);
    if (close == std::string::npos) {
      throw std::invalid_argument("Unterminated field name in '" + format + "'");
    }
    std::string key = format.substr(i + 2, close - i - 2);
    auto it = kFields.find(key);
    if (it == kFields.end()) {
      throw std::invalid_argument("Unknown format field '" + key + "'");
    }

    Segment seg;
    seg.field = it->second;
    seg.text = key;
    i = close + 1;

    // Flags
    while (i < n && (format[i] == '-' || format[i] == '0' || format[i] == ' ' ||
                     format[i] == '+' || format[i] == '#')) {
      if (format[i] == '-') {
        seg.left_align = true;
      } else if (format[i] == '0') {
        seg.zero_pad = true;
      }
      ++i;
    }
    // Width
    while (i < n && format[i] >= '0' && format[i] <= '9') {
      seg.width = seg.width * 10 + (format[i] - '0');
      ++i;
    }
    // Precision
    if (i < n && format[i] == '.') {
      ++i;
      seg.precision = 0;
      while (i < n && format[i] >= '0' && format[i] <= '9') {
        seg.precision = seg.precision * 10 + (format[i] - '0');
        ++i;
      }
    }
    if (i >= n) {
      throw std::invalid_argument("Missing conversion for field '" + key + "'");
    }

    char conv = format[i];
    switch (conv) {
      case 's':
      case 'r':
        seg.conversion = 's';
        break;
      case 'd':
      case 'i':
      case 'f':
        if (!is_numeric_field(key)) {
          throw std::invalid_argument(
            "Field '" + key + "' is text and cannot use conversion '" + std::string(1, conv) + "'"
          );
        }
        seg.conversion = conv == 'i' ? 'd' : conv;
        break;
      default:
        throw std::invalid_argument(
          "Unsupported conversion '" + std::string(1, conv) + "' for field '" + key + "'"
        );
    }
    ++i;

    flush_literal();
    segments_.push_back(seg);
  }
  flush_literal();
}

std::string RecordFormatter::format_time(const LogRecord& record) const {
  std::time_t seconds = std::chrono::system_clock::to_time_t(record.timestamp);
  std::tm tm_buf{};
  if (utc_) {
    gmtime_r(&seconds, &tm_buf);
  } else {
    localtime_r(&seconds, &tm_buf);
  }

  std::string out(64, '\0');
  for (int attempt = 0; attempt < 6; ++attempt) {
    size_t written = std::strftime(&out[0], out.size(), datefmt_.c_str(), &tm_buf);
    if (written > 0) {
      out.resize(written);
      return out;
    }
    out.resize(out.size() * 4);
  }
  return std::string();
}

std::string RecordFormatter::render(const Segment& seg, const LogRecord& record) const {
  using namespace std::chrono;

  const auto since_epoch = record.timestamp.time_since_epoch();
  const long long total_ns = duration_cast<nanoseconds>(since_epoch).count();

  std::string value;
  bool numeric = false;

  switch (seg.field) {
    case Field::literal:
      return seg.text;
    case Field::name:
      value = record.channel.empty() ? "root" : record.channel;
      break;
    case Field::levelname:
      value = logging::severity_name(record.severity);
      break;
    case Field::message:
      value = record.message;
      break;
    case Field::asctime:
      value = format_time(record);
      break;
    case Field::filename:
      value = record.location ? basename_of(record.location->file) : kUnknownFile;
      break;
    case Field::pathname:
      value = record.location ? record.location->file : kUnknownFile;
      break;
    case Field::module:
      value = record.location ? module_of(record.location->file) : "Unknown module";
      break;
    case Field::func_name:
      value = record.location && !record.location->function.empty() ? record.location->function
                                                                     : kUnknownFunction;
      break;
    case Field::levelno:
    case Field::lineno:
    case Field::process:
    case Field::thread:
    case Field::msecs:
    case Field::created: {
      numeric = true;
      long long integral = 0;
      double real = 0.0;
      switch (seg.field) {
        case Field::levelno:
          integral = logging::severity_number(record.severity);
          break;
        case Field::lineno:
          integral = record.location ? record.location->line : 0;
          break;
        case Field::process:
          integral = static_cast<long long>(record.process_id);
          break;
        case Field::thread:
          integral = static_cast<long long>(record.thread_id);
          break;
        case Field::msecs:
          integral = (total_ns % 1000000000LL) / 1000000LL;
          real = static_cast<double>(total_ns % 1000000000LL) / 1e6;
          break;
        default:
          integral = total_ns / 1000000000LL;
          real = static_cast<double>(total_ns) / 1e9;
          break;
      }
      if (seg.field != Field::msecs && seg.field != Field::created) {
        real = static_cast<double>(integral);
      }

      if (seg.conversion == 'f') {
        value = format_double(real, seg.precision);
      } else if (seg.conversion == 'd') {
        value = format_integer(integral, seg.precision);
      } else if (seg.field == Field::created) {
        value = format_double(real, seg.precision);
      } else if (seg.field == Field::thread) {
        value = std::to_string(record.thread_id);
      } else {
        value = std::to_string(integral);
      }
      break;
    }
  }

  if (!numeric && seg.precision >= 0 && value.size() > static_cast<size_t>(seg.precision)) {
    value.resize(static_cast<size_t>(seg.precision));
  }

  if (seg.width > 0 && value.size() < static_cast<size_t>(seg.width)) {
    size_t pad = static_cast<size_t>(seg.width) - value.size();
    if (seg.left_align) {
      value.append(pad, ' ');
    } else if (seg.zero_pad && numeric) {
      size_t sign = (!value.empty() && value[0] == '-') ? 1 : 0;
      value.insert(sign, pad, '0');
    } else {
      value.insert(0, pad, ' ');
    }
  }
  return value;
}

std::string RecordFormatter::format(const LogRecord& record) const {
  std::string line;
  line.reserve(record.message.size() + 64);
  for (const auto& seg : segments_) {
    line += render(seg, record);
  }
  return line;
}

}  // namespace record
}  // namespace funnel
