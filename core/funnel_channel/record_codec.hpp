// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_RECORD_CODEC_HPP
#define FUNNEL_RECORD_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "log_record.hpp"

namespace funnel {
namespace channel {

/**
 * Frame layout between worker and owner:
 *   [4-byte big-endian payload length][JSON payload]
 *
 * Payload fields: ts_ns, channel, level, msg, pid, tid and, when the record
 * has a source location, file, line, func. A text field (channel, msg, file,
 * func) that is not valid UTF-8 is sent as "<key>_bytes", an array of its raw
 * byte values, so the owner writes the same bytes a standalone process would.
 */
constexpr size_t kFrameHeaderSize = 4;
constexpr uint32_t kMaxFrameSize = 16 * 1024 * 1024;

/**
 * Serialize a record to its JSON payload.
 */
std::string encode_payload(const record::LogRecord& record);

/**
 * Serialize a record to a complete frame (header + payload).
 * @throws RecordDecodeError if the payload exceeds kMaxFrameSize
 */
std::string encode_frame(const record::LogRecord& record);

/**
 * Parse a JSON payload back into a record.
 * @throws RecordDecodeError on malformed JSON, missing or mistyped fields
 *         or an unknown level
 */
record::LogRecord decode_payload(const std::string& payload);

/**
 * Read the payload length from a frame header.
 * @throws RecordDecodeError if the length is zero or exceeds kMaxFrameSize
 */
uint32_t decode_frame_length(const unsigned char* header);

}  // namespace channel
}  // namespace funnel

#endif  // FUNNEL_RECORD_CODEC_HPP
