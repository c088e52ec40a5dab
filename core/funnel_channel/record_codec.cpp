// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "record_codec.hpp"

#include <vector>

#include <nlohmann/json.hpp>

#include "funnel_errors.hpp"
#include "funnel_log_init.hpp"

namespace funnel {
namespace channel {

namespace {

const nlohmann::json& require(
  const nlohmann::json& obj, const char* key, nlohmann::json::value_t type
) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw RecordDecodeError(std::string("Record frame is missing '") + key + "'");
  }
  bool ok = it->type() == type;
  // Integer fields may arrive signed or unsigned
  if (type == nlohmann::json::value_t::number_integer) {
    ok = it->is_number_integer();
  }
  if (!ok) {
    throw RecordDecodeError(std::string("Record frame field '") + key + "' has the wrong type");
  }
  return *it;
}

bool is_valid_utf8(const std::string& text) {
  size_t i = 0;
  const size_t n = text.size();
  while (i < n) {
    const unsigned char lead = static_cast<unsigned char>(text[i]);
    size_t extra = 0;
    uint32_t cp = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      extra = 1;
      cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      extra = 2;
      cp = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      extra = 3;
      cp = lead & 0x07;
    } else {
      return false;
    }
    if (n - i <= extra) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      const unsigned char cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    // Overlong forms, surrogates and code points past U+10FFFF
    if ((extra == 2 && cp < 0x800) || (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

// Text that is not valid UTF-8 travels as "<key>_bytes", an array of byte values
void put_text(nlohmann::json& obj, const std::string& key, const std::string& value) {
  if (is_valid_utf8(value)) {
    obj[key] = value;
  } else {
    obj[key + "_bytes"] = std::vector<uint8_t>(value.begin(), value.end());
  }
}

bool has_text(const nlohmann::json& obj, const std::string& key) {
  return obj.contains(key) || obj.contains(key + "_bytes");
}

std::string get_text(const nlohmann::json& obj, const std::string& key) {
  if (obj.contains(key)) {
    return require(obj, key.c_str(), nlohmann::json::value_t::string).get<std::string>();
  }
  const std::string bytes_key = key + "_bytes";
  auto it = obj.find(bytes_key);
  if (it == obj.end()) {
    throw RecordDecodeError("Record frame is missing '" + key + "'");
  }
  if (!it->is_array()) {
    throw RecordDecodeError("Record frame field '" + bytes_key + "' has the wrong type");
  }
  std::string value;
  value.reserve(it->size());
  for (const auto& byte : *it) {
    if (!byte.is_number_unsigned() || byte.get<uint64_t>() > 0xFF) {
      throw RecordDecodeError("Record frame field '" + bytes_key + "' holds a non-byte value");
    }
    value.push_back(static_cast<char>(byte.get<uint64_t>()));
  }
  return value;
}

}  // namespace

std::string encode_payload(const record::LogRecord& record) {
  nlohmann::json obj;
  obj["ts_ns"] = static_cast<int64_t>(
    std::chrono::duration_cast<std::chrono::nanoseconds>(record.timestamp.time_since_epoch())
      .count()
  );
  put_text(obj, "channel", record.channel);
  obj["level"] = logging::severity_name(record.severity);
  put_text(obj, "msg", record.message);
  if (record.location) {
    put_text(obj, "file", record.location->file);
    obj["line"] = record.location->line;
    put_text(obj, "func", record.location->function);
  }
  obj["pid"] = record.process_id;
  obj["tid"] = record.thread_id;
  return obj.dump();
}

std::string encode_frame(const record::LogRecord& record) {
  std::string payload = encode_payload(record);
  if (payload.size() > kMaxFrameSize) {
    throw RecordDecodeError(
      "Record of " + std::to_string(payload.size()) + " bytes exceeds the frame limit"
    );
  }
  uint32_t length = static_cast<uint32_t>(payload.size());

  std::string frame;
  frame.reserve(kFrameHeaderSize + payload.size());
  frame.push_back(static_cast<char>((length >> 24) & 0xFF));
  frame.push_back(static_cast<char>((length >> 16) & 0xFF));
  frame.push_back(static_cast<char>((length >> 8) & 0xFF));
  frame.push_back(static_cast<char>(length & 0xFF));
  frame += payload;
  return frame;
}

uint32_t decode_frame_length(const unsigned char* header) {
  uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                    (static_cast<uint32_t>(header[1]) << 16) |
                    (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
  if (length == 0 || length > kMaxFrameSize) {
    throw RecordDecodeError("Invalid frame length " + std::to_string(length));
  }
  return length;
}

record::LogRecord decode_payload(const std::string& payload) {
  nlohmann::json obj;
  try {
    obj = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& e) {
    throw RecordDecodeError("Malformed record frame: " + std::string(e.what()));
  }
  if (!obj.is_object()) {
    throw RecordDecodeError("Record frame is not a JSON object");
  }

  using value_t = nlohmann::json::value_t;
  record::LogRecord record;

  int64_t ts_ns = require(obj, "ts_ns", value_t::number_integer).get<int64_t>();
  record.timestamp = std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::nanoseconds(ts_ns)
    )
  );
  record.channel = get_text(obj, "channel");

  std::string level = require(obj, "level", value_t::string).get<std::string>();
  auto severity = logging::parse_severity_level(level);
  if (!severity) {
    throw RecordDecodeError("Record frame has unknown level '" + level + "'");
  }
  record.severity = *severity;

  record.message = get_text(obj, "msg");
  record.process_id = require(obj, "pid", value_t::number_integer).get<int64_t>();
  record.thread_id = require(obj, "tid", value_t::number_integer).get<uint64_t>();

  if (has_text(obj, "file")) {
    record::SourceLocation location;
    location.file = get_text(obj, "file");
    location.line = require(obj, "line", value_t::number_integer).get<int>();
    location.function = get_text(obj, "func");
    record.location = location;
  }
  return record;
}

}  // namespace channel
}  // namespace funnel
