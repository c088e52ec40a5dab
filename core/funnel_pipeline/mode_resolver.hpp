// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_MODE_RESOLVER_HPP
#define FUNNEL_MODE_RESOLVER_HPP

#include <optional>

#include "channel_handle.hpp"

namespace funnel {
namespace pipeline {

/**
 * Process topology a facade operates in. Fixed at construction.
 */
enum class OperatingMode {
  standalone,         // Single process, sinks written on the caller thread
  aggregation_owner,  // Owns the sinks and drains records from workers
  worker              // Holds no sinks, forwards records to the owner
};

const char* to_string(OperatingMode mode);

/**
 * Decide the operating mode.
 *
 * A supplied channel only matters when multiprocess logging is wanted;
 * otherwise it is ignored and the result is standalone.
 */
OperatingMode resolve_mode(
  bool wants_multiprocess, const std::optional<channel::RecordChannelHandle>& supplied_channel
);

}  // namespace pipeline
}  // namespace funnel

#endif  // FUNNEL_MODE_RESOLVER_HPP
