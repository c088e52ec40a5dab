// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mode_resolver.hpp"

namespace funnel {
namespace pipeline {

const char* to_string(OperatingMode mode) {
  switch (mode) {
    case OperatingMode::standalone:
      return "standalone";
    case OperatingMode::aggregation_owner:
      return "aggregation_owner";
    case OperatingMode::worker:
      return "worker";
    default:
      return "unknown";
  }
}

OperatingMode resolve_mode(
  bool wants_multiprocess, const std::optional<channel::RecordChannelHandle>& supplied_channel
) {
  if (!wants_multiprocess) {
    return OperatingMode::standalone;
  }
  if (!supplied_channel) {
    return OperatingMode::aggregation_owner;
  }
  return OperatingMode::worker;
}

}  // namespace pipeline
}  // namespace funnel
