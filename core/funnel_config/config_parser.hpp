// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_CONFIG_PARSER_HPP
#define FUNNEL_CONFIG_PARSER_HPP

#include <nlohmann/json_fwd.hpp>

#include <string>

#include "logging_config.hpp"

namespace funnel {
namespace config {

/**
 * Reads a LoggingConfig from YAML or JSON.
 *
 * YAML documents are converted to a JSON tree first so both formats share
 * one reader. On failure the load functions return false and the reason is
 * available from get_last_error(); the output config is left in an
 * unspecified but valid state.
 */
class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from a file. The format is chosen by extension:
   * .yaml / .yml for YAML, .json for JSON.
   */
  bool load_from_file(const std::string& path, LoggingConfig& config);

  /**
   * Load configuration from YAML text
   */
  bool load_from_string(const std::string& yaml_content, LoggingConfig& config);

  /**
   * Load configuration from JSON text
   */
  bool load_from_json_string(const std::string& json_content, LoggingConfig& config);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  typedef nlohmann::ordered_json json;

  bool parse_document(const json& doc, LoggingConfig& config);
  bool parse_root(const json& node, RootConfig& root);
  bool parse_loggers(const json& node, std::map<std::string, ChannelConfig>& loggers);
  bool parse_handlers(const json& node, std::vector<SinkConfig>& handlers);
  bool parse_handler(const std::string& name, const json& node, SinkConfig& sink);
  bool parse_multiprocess(const json& node, ChannelSettings& settings);
  bool parse_diagnostics(const json& node, logging::DiagnosticsConfig& diagnostics);

  bool parse_level(const json& node, const std::string& where, severity_level& level);
  bool parse_handler_list(
    const json& node, const std::string& where, std::vector<std::string>& names
  );

  // Last error message
  mutable std::string last_error_;
};

}  // namespace config
}  // namespace funnel

#endif  // FUNNEL_CONFIG_PARSER_HPP
