// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "channel_registry.hpp"

#include <mutex>

namespace funnel {
namespace pipeline {

ChannelRegistry::ChannelRegistry(const config::LoggingConfig& config)
    : root_handlers_(config.root_handlers())
    , root_propagate_(config.root.propagate) {
  Node root;
  root.level = config.root.level;
  root.level_from_config = config.root.level_given;
  root.configured = true;
  root.propagate = false;
  root.handlers = root_handlers_;
  nodes_[""] = root;

  for (const auto& entry : config.loggers) {
    if (entry.first.empty()) {
      continue;
    }
    Node node;
    node.level = entry.second.level;
    node.level_from_config = entry.second.level.has_value();
    node.configured = true;
    node.propagate = entry.second.propagate;
    node.handlers = entry.second.handlers;
    nodes_[entry.first] = node;
  }
}

std::string ChannelRegistry::parent_of(const std::string& name) {
  size_t dot = name.rfind('.');
  if (dot == std::string::npos) {
    return std::string();
  }
  return name.substr(0, dot);
}

void ChannelRegistry::obtain(const std::string& name, std::optional<severity_level> default_level) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = nodes_.find(name);
  if (it == nodes_.end()) {
    Node node;
    node.propagate = root_propagate_;
    it = nodes_.emplace(name, node).first;
  }

  Node& node = it->second;
  if (default_level && !node.level_from_config) {
    node.level = default_level;
  }
}

severity_level ChannelRegistry::effective_level(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::string current = name;
  while (true) {
    auto it = nodes_.find(current);
    if (it != nodes_.end() && it->second.level) {
      return *it->second.level;
    }
    if (current.empty()) {
      break;
    }
    current = parent_of(current);
  }
  // Unreachable in practice: the root always carries a level
  return severity_level::warning;
}

std::vector<std::string> ChannelRegistry::route(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<std::string> targets;
  std::string current = name;
  bool origin = true;

  while (true) {
    if (current.empty()) {
      targets.insert(targets.end(), root_handlers_.begin(), root_handlers_.end());
      break;
    }

    auto it = nodes_.find(current);
    bool known = it != nodes_.end();
    if (known && it->second.configured) {
      const Node& node = it->second;
      targets.insert(targets.end(), node.handlers.begin(), node.handlers.end());
      if (!node.propagate) {
        break;
      }
    } else if (known || origin) {
      // Unconfigured channel: without propagation it writes to the root's
      // sinks directly and stops there
      if (!root_propagate_) {
        targets.insert(targets.end(), root_handlers_.begin(), root_handlers_.end());
        break;
      }
    }
    // Placeholders pass straight through

    current = parent_of(current);
    origin = false;
  }
  return targets;
}

bool ChannelRegistry::is_registered(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return nodes_.find(name) != nodes_.end();
}

}  // namespace pipeline
}  // namespace funnel
