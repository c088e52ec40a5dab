// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_ERRORS_HPP
#define FUNNEL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace funnel {

/**
 * Base class for every error raised by the funnel libraries.
 */
class FunnelError : public std::runtime_error {
public:
  explicit FunnelError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * Configuration file missing, unreadable, malformed or semantically invalid.
 * Fatal at facade construction.
 */
class ConfigParseError : public FunnelError {
public:
  explicit ConfigParseError(const std::string& what)
      : FunnelError(what) {}
};

/**
 * A sink could not be built (bad path, missing directory, unsupported option).
 * Fatal for that sink only.
 */
class SinkConstructionError : public FunnelError {
public:
  SinkConstructionError(const std::string& path, const std::string& reason)
      : FunnelError("Cannot build sink for '" + path + "': " + reason)
      , path_(path)
      , reason_(reason) {}

  const std::string& path() const {
    return path_;
  }

  const std::string& reason() const {
    return reason_;
  }

private:
  std::string path_;
  std::string reason_;
};

/**
 * A sink failed to persist a record. Recovered by the dispatcher, never
 * surfaced to producers.
 */
class SinkWriteError : public FunnelError {
public:
  explicit SinkWriteError(const std::string& what)
      : FunnelError(what) {}
};

/**
 * Worker could not reach the aggregation owner's endpoint.
 */
class ChannelConnectError : public FunnelError {
public:
  explicit ChannelConnectError(const std::string& what)
      : FunnelError(what) {}
};

/**
 * Aggregation owner could not create its endpoint.
 */
class ChannelBindError : public FunnelError {
public:
  explicit ChannelBindError(const std::string& what)
      : FunnelError(what) {}
};

/**
 * A frame received from a worker is not a valid record.
 */
class RecordDecodeError : public FunnelError {
public:
  explicit RecordDecodeError(const std::string& what)
      : FunnelError(what) {}
};

}  // namespace funnel

#endif  // FUNNEL_ERRORS_HPP
