// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_CHANNEL_REGISTRY_HPP
#define FUNNEL_CHANNEL_REGISTRY_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "funnel_log_severity.hpp"
#include "logging_config.hpp"

namespace funnel {
namespace pipeline {

using logging::severity_level;

/**
 * Tree of dotted channel names rooted at "" (the root channel).
 *
 * Holds per-channel levels, propagation flags and handler attachments, and
 * answers the two questions the dispatch path asks: is a severity enabled
 * for a channel, and which sinks does a record from that channel reach.
 *
 * Thread-safe: obtain() takes the write lock, every query the read lock.
 */
class ChannelRegistry {
public:
  /**
   * Seed the root and every `loggers:` entry from the configuration.
   */
  explicit ChannelRegistry(const config::LoggingConfig& config);

  // Non-copyable
  ChannelRegistry(const ChannelRegistry&) = delete;
  ChannelRegistry& operator=(const ChannelRegistry&) = delete;

  /**
   * Register a channel on behalf of a caller.
   *
   * Level precedence: configured level, then default_level, then inherited.
   * The root keeps `root.level` when the configuration sets it; otherwise
   * default_level replaces the WARNING default.
   */
  void obtain(const std::string& name, std::optional<severity_level> default_level = std::nullopt);

  /**
   * Nearest level set on the channel or one of its ancestors.
   */
  severity_level effective_level(const std::string& name) const;

  bool is_enabled_for(const std::string& name, severity_level level) const {
    return level >= effective_level(name);
  }

  /**
   * Handler names a record from this channel is offered to, in order.
   * Names never obtained behave like obtained unconfigured channels.
   */
  std::vector<std::string> route(const std::string& name) const;

  bool is_registered(const std::string& name) const;

  /**
   * "a.b.c" -> "a.b", "a" -> "" (root), "" -> "".
   */
  static std::string parent_of(const std::string& name);

private:
  struct Node {
    std::optional<severity_level> level;
    bool level_from_config = false;
    bool configured = false;  // Has a `loggers:` entry (or is the root)
    bool propagate = false;
    std::vector<std::string> handlers;
  };

  mutable std::shared_mutex mutex_;
  std::map<std::string, Node> nodes_;
  std::vector<std::string> root_handlers_;
  bool root_propagate_ = false;
};

}  // namespace pipeline
}  // namespace funnel

#endif  // FUNNEL_CHANNEL_REGISTRY_HPP
