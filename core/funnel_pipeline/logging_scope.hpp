// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_LOGGING_SCOPE_HPP
#define FUNNEL_LOGGING_SCOPE_HPP

#include <memory>
#include <stdexcept>
#include <utility>

#include "logger_facade.hpp"

namespace funnel {
namespace pipeline {

/**
 * Scoped acquisition of a LoggerFacade: stop() runs when the scope ends,
 * whether by normal exit, early return or exception.
 *
 * Usage:
 *   LoggingScope scope(std::make_unique<LoggerFacade>("logging.yaml", true));
 *   auto log = scope->get_channel("app");
 */
class LoggingScope {
public:
  /**
   * Take ownership of a facade.
   */
  explicit LoggingScope(std::unique_ptr<LoggerFacade> facade)
      : owned_(std::move(facade))
      , facade_(owned_.get()) {
    if (!facade_) {
      throw std::invalid_argument("LoggingScope requires a facade");
    }
  }

  /**
   * Guard a facade owned elsewhere.
   */
  explicit LoggingScope(LoggerFacade& facade)
      : facade_(&facade) {}

  ~LoggingScope() {
    facade_->stop();
  }

  // Non-copyable, non-movable
  LoggingScope(const LoggingScope&) = delete;
  LoggingScope& operator=(const LoggingScope&) = delete;
  LoggingScope(LoggingScope&&) = delete;
  LoggingScope& operator=(LoggingScope&&) = delete;

  LoggerFacade& facade() const {
    return *facade_;
  }

  LoggerFacade* operator->() const {
    return facade_;
  }

private:
  std::unique_ptr<LoggerFacade> owned_;
  LoggerFacade* facade_;
};

}  // namespace pipeline
}  // namespace funnel

#endif  // FUNNEL_LOGGING_SCOPE_HPP
