// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#define FUNNEL_LOG_COMPONENT "config_parser"
#include <funnel_log_macros.hpp>

namespace funnel {
namespace config {

namespace {

typedef nlohmann::ordered_json json;

// ============================================================================
// YAML to JSON conversion helper
// ============================================================================

json yaml_node_to_json(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Scalar: {
      // Quoted scalars stay strings; plain ones try integer, double, bool
      if (node.Tag() == "!") {
        return node.Scalar();
      }
      int64_t integer = 0;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return integer;
      }
      double real = 0.0;
      if (YAML::convert<double>::decode(node, real)) {
        return real;
      }
      bool boolean = false;
      if (YAML::convert<bool>::decode(node, boolean)) {
        return boolean;
      }
      return node.Scalar();
    }
    case YAML::NodeType::Sequence: {
      json arr = json::array();
      for (const auto& item : node) {
        arr.push_back(yaml_node_to_json(item));
      }
      return arr;
    }
    case YAML::NodeType::Map: {
      json obj = json::object();
      for (const auto& kv : node) {
        obj[kv.first.Scalar()] = yaml_node_to_json(kv.second);
      }
      return obj;
    }
    default:
      return nullptr;
  }
}

std::string extension_of(const std::string& path) {
  auto slash = path.find_last_of('/');
  auto dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return std::string();
  }
  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return ext;
}

// Typed field readers. Absent keys leave the target untouched.

bool read_bool(
  const json& node, const char* key, const std::string& where, bool& out, std::string& error
) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return true;
  }
  if (!it->is_boolean()) {
    error = where + "." + key + " must be a boolean";
    return false;
  }
  out = it->get<bool>();
  return true;
}

bool read_string(
  const json& node, const char* key, const std::string& where, std::string& out,
  std::string& error
) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error = where + "." + key + " must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_int(
  const json& node, const char* key, const std::string& where, int64_t& out, std::string& error
) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    error = where + "." + key + " must be an integer";
    return false;
  }
  out = it->get<int64_t>();
  return true;
}

}  // namespace

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, LoggingConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  std::string ext = extension_of(path);
  if (ext == ".yaml" || ext == ".yml") {
    try {
      YAML::Node yaml = YAML::LoadFile(path);
      return parse_document(yaml_node_to_json(yaml), config);
    } catch (const YAML::Exception& e) {
      last_error_ = "Failed to parse YAML file: " + std::string(e.what());
      return false;
    }
  }

  if (ext == ".json") {
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json_string(buffer.str(), config);
  }

  last_error_ = "Unsupported config file format '" + ext + "': " + path;
  return false;
}

bool ConfigParser::load_from_string(const std::string& yaml_content, LoggingConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    return parse_document(yaml_node_to_json(node), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_json_string(const std::string& json_content, LoggingConfig& config) {
  try {
    return parse_document(json::parse(json_content), config);
  } catch (const json::parse_error& e) {
    last_error_ = "Failed to parse JSON content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_document(const json& doc, LoggingConfig& config) {
  // An empty document yields the defaults
  if (doc.is_null()) {
    return true;
  }
  if (!doc.is_object()) {
    last_error_ = "Top level of the logging configuration must be a mapping";
    return false;
  }

  auto section = [&doc](const char* key) -> const json* {
    auto it = doc.find(key);
    return it == doc.end() || it->is_null() ? nullptr : &*it;
  };

  if (const json* node = section("handlers")) {
    if (!parse_handlers(*node, config.handlers)) {
      return false;
    }
  }
  if (const json* node = section("root")) {
    if (!parse_root(*node, config.root)) {
      return false;
    }
  }
  if (const json* node = section("loggers")) {
    if (!parse_loggers(*node, config.loggers)) {
      return false;
    }
  }
  if (const json* node = section("multiprocess")) {
    if (!parse_multiprocess(*node, config.multiprocess)) {
      return false;
    }
  }
  if (const json* node = section("diagnostics")) {
    if (!parse_diagnostics(*node, config.diagnostics)) {
      return false;
    }
  }

  // Every referenced handler must exist
  for (const auto& name : config.root.handlers) {
    if (!config.find_handler(name)) {
      last_error_ = "root references unknown handler '" + name + "'";
      return false;
    }
  }
  for (const auto& entry : config.loggers) {
    for (const auto& name : entry.second.handlers) {
      if (!config.find_handler(name)) {
        last_error_ = "loggers." + entry.first + " references unknown handler '" + name + "'";
        return false;
      }
    }
  }

  FUNNEL_LOG_DEBUG(
    "Logging configuration parsed" << logging::kv("handlers", config.handlers.size())
                                   << logging::kv("loggers", config.loggers.size())
  );
  return true;
}

bool ConfigParser::parse_level(
  const json& node, const std::string& where, severity_level& level
) {
  if (!node.is_string()) {
    last_error_ = where + " must be a severity name";
    return false;
  }
  auto parsed = logging::parse_severity_level(node.get<std::string>());
  if (!parsed) {
    last_error_ = where + ": unknown severity '" + node.get<std::string>() + "'";
    return false;
  }
  level = *parsed;
  return true;
}

bool ConfigParser::parse_handler_list(
  const json& node, const std::string& where, std::vector<std::string>& names
) {
  if (!node.is_array()) {
    last_error_ = where + " must be a sequence of handler names";
    return false;
  }
  names.clear();
  for (const auto& item : node) {
    if (!item.is_string()) {
      last_error_ = where + " entries must be handler names";
      return false;
    }
    names.push_back(item.get<std::string>());
  }
  return true;
}

bool ConfigParser::parse_root(const json& node, RootConfig& root) {
  if (!node.is_object()) {
    last_error_ = "root must be a mapping";
    return false;
  }
  if (node.contains("level") && !node["level"].is_null()) {
    if (!parse_level(node["level"], "root.level", root.level)) {
      return false;
    }
    root.level_given = true;
  }
  if (!read_bool(node, "propagate", "root", root.propagate, last_error_)) {
    return false;
  }
  if (node.contains("handlers") && !node["handlers"].is_null()) {
    if (!parse_handler_list(node["handlers"], "root.handlers", root.handlers)) {
      return false;
    }
    root.handlers_given = true;
  }
  return true;
}

bool ConfigParser::parse_loggers(
  const json& node, std::map<std::string, ChannelConfig>& loggers
) {
  if (!node.is_object()) {
    last_error_ = "loggers must be a mapping of channel names";
    return false;
  }
  loggers.clear();
  for (auto it = node.begin(); it != node.end(); ++it) {
    const std::string where = "loggers." + it.key();
    const json& entry = it.value();
    ChannelConfig channel;

    if (!entry.is_null()) {
      if (!entry.is_object()) {
        last_error_ = where + " must be a mapping";
        return false;
      }
      if (entry.contains("level") && !entry["level"].is_null()) {
        severity_level level = severity_level::warning;
        if (!parse_level(entry["level"], where + ".level", level)) {
          return false;
        }
        channel.level = level;
      }
      if (!read_bool(entry, "propagate", where, channel.propagate, last_error_)) {
        return false;
      }
      if (entry.contains("handlers") && !entry["handlers"].is_null()) {
        if (!parse_handler_list(entry["handlers"], where + ".handlers", channel.handlers)) {
          return false;
        }
      }
    }
    loggers[it.key()] = channel;
  }
  return true;
}

bool ConfigParser::parse_handlers(const json& node, std::vector<SinkConfig>& handlers) {
  if (!node.is_object()) {
    last_error_ = "handlers must be a mapping of handler names";
    return false;
  }
  handlers.clear();
  for (auto it = node.begin(); it != node.end(); ++it) {
    SinkConfig sink;
    if (!parse_handler(it.key(), it.value(), sink)) {
      return false;
    }
    handlers.push_back(sink);
  }
  return true;
}

bool ConfigParser::parse_handler(const std::string& name, const json& node, SinkConfig& sink) {
  const std::string where = "handlers." + name;
  if (!node.is_object()) {
    last_error_ = where + " must be a mapping";
    return false;
  }
  sink.name = name;

  std::string type = "stream";
  if (!read_string(node, "type", where, type, last_error_)) {
    return false;
  }
  auto kind = parse_sink_kind(type);
  if (!kind) {
    last_error_ = where + ": unknown handler type '" + type + "'";
    return false;
  }
  sink.kind = *kind;
  if (sink.kind == SinkKind::rotating_by_time) {
    sink.backup_count = 7;
  }

  if (node.contains("level") && !node["level"].is_null()) {
    if (!parse_level(node["level"], where + ".level", sink.level)) {
      return false;
    }
  }

  if (node.contains("formatter") && !node["formatter"].is_null()) {
    const json& formatter = node["formatter"];
    if (!formatter.is_object()) {
      last_error_ = where + ".formatter must be a mapping";
      return false;
    }
    if (!read_string(formatter, "format", where + ".formatter", sink.formatter.format,
                     last_error_) ||
        !read_string(formatter, "datefmt", where + ".formatter", sink.formatter.datefmt,
                     last_error_)) {
      return false;
    }
  }

  int64_t max_bytes = static_cast<int64_t>(sink.max_bytes);
  int64_t backup_count = sink.backup_count;
  int64_t interval = sink.interval;

  if (!read_string(node, "stream", where, sink.stream, last_error_) ||
      !read_bool(node, "colors", where, sink.colors, last_error_) ||
      !read_string(node, "filename", where, sink.filename, last_error_) ||
      !read_string(node, "mode", where, sink.mode, last_error_) ||
      !read_string(node, "encoding", where, sink.encoding, last_error_) ||
      !read_int(node, "max_bytes", where, max_bytes, last_error_) ||
      !read_int(node, "backup_count", where, backup_count, last_error_) ||
      !read_string(node, "when", where, sink.when, last_error_) ||
      !read_int(node, "interval", where, interval, last_error_) ||
      !read_bool(node, "utc", where, sink.utc, last_error_)) {
    return false;
  }

  if (max_bytes < 0 || backup_count < 0) {
    last_error_ = where + ": max_bytes and backup_count must not be negative";
    return false;
  }
  if (interval <= 0) {
    last_error_ = where + ".interval must be positive";
    return false;
  }
  if (sink.stream != "stderr" && sink.stream != "stdout") {
    last_error_ = where + ".stream must be 'stderr' or 'stdout'";
    return false;
  }

  sink.max_bytes = static_cast<uint64_t>(max_bytes);
  sink.backup_count = static_cast<int>(backup_count);
  sink.interval = static_cast<int>(interval);
  return true;
}

bool ConfigParser::parse_multiprocess(const json& node, ChannelSettings& settings) {
  if (!node.is_object()) {
    last_error_ = "multiprocess must be a mapping";
    return false;
  }

  int64_t drain_ms = settings.drain_timeout.count();
  std::string overflow = to_string(settings.overflow);
  if (!read_int(node, "queue_size", "multiprocess", settings.queue_size, last_error_) ||
      !read_string(node, "overflow", "multiprocess", overflow, last_error_) ||
      !read_string(node, "socket_dir", "multiprocess", settings.socket_dir, last_error_) ||
      !read_int(node, "drain_timeout_ms", "multiprocess", drain_ms, last_error_)) {
    return false;
  }

  if (settings.queue_size == 0 || settings.queue_size < kUnboundedQueue) {
    last_error_ = "multiprocess.queue_size must be -1 (unbounded) or positive";
    return false;
  }
  auto policy = parse_overflow_policy(overflow);
  if (!policy) {
    last_error_ = "multiprocess.overflow must be 'block' or 'drop'";
    return false;
  }
  if (drain_ms < 0) {
    last_error_ = "multiprocess.drain_timeout_ms must not be negative";
    return false;
  }

  settings.overflow = *policy;
  settings.drain_timeout = std::chrono::milliseconds(drain_ms);
  return true;
}

bool ConfigParser::parse_diagnostics(const json& node, logging::DiagnosticsConfig& diagnostics) {
  if (!node.is_object()) {
    last_error_ = "diagnostics must be a mapping";
    return false;
  }
  if (!read_bool(node, "enabled", "diagnostics", diagnostics.enabled, last_error_) ||
      !read_bool(node, "colors", "diagnostics", diagnostics.colors, last_error_)) {
    return false;
  }
  if (node.contains("level") && !node["level"].is_null()) {
    if (!parse_level(node["level"], "diagnostics.level", diagnostics.level)) {
      return false;
    }
  }
  return true;
}

}  // namespace config
}  // namespace funnel
