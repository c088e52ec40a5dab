// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_SINK_FACTORY_HPP
#define FUNNEL_SINK_FACTORY_HPP

#include <iostream>
#include <memory>

#include "logging_config.hpp"
#include "sink.hpp"
#include "timed_rotating_file_sink.hpp"

namespace funnel {
namespace sinks {

/**
 * Builds concrete sinks from a kind tag and a handler configuration.
 *
 * The console streams and the rotation clock are injected so tests can
 * capture output and drive time.
 */
class SinkFactory {
public:
  explicit SinkFactory(
    std::ostream& out = std::cout, std::ostream& err = std::cerr, Clock clock = default_clock()
  );

  /**
   * @throws SinkConstructionError (carrying the target path) when the sink
   *         cannot be created; directories are never created
   */
  std::unique_ptr<Sink> build(config::SinkKind kind, const config::SinkConfig& config) const;

  std::unique_ptr<Sink> build(const config::SinkConfig& config) const {
    return build(config.kind, config);
  }

private:
  std::ostream* out_;
  std::ostream* err_;
  Clock clock_;
};

}  // namespace sinks
}  // namespace funnel

#endif  // FUNNEL_SINK_FACTORY_HPP
