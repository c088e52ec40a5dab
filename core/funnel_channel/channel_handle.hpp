// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_CHANNEL_HANDLE_HPP
#define FUNNEL_CHANNEL_HANDLE_HPP

#include <string>
#include <utility>

namespace funnel {
namespace channel {

/**
 * Copyable name of an aggregation owner's endpoint.
 *
 * Textual form is "unix:<socket path>", suitable for a command line argument
 * or an environment variable.
 */
class RecordChannelHandle {
public:
  static constexpr const char* kScheme = "unix:";

  RecordChannelHandle() = default;

  explicit RecordChannelHandle(std::string socket_path)
      : socket_path_(std::move(socket_path)) {}

  /**
   * Parse the textual form.
   * @throws std::invalid_argument on an empty string, unknown scheme or empty path
   */
  static RecordChannelHandle from_string(const std::string& text);

  /**
   * Fresh, unused endpoint under the given directory (the system temp
   * directory when empty).
   */
  static RecordChannelHandle generate(const std::string& socket_dir);

  std::string to_string() const;

  const std::string& socket_path() const {
    return socket_path_;
  }

  bool valid() const {
    return !socket_path_.empty();
  }

  bool operator==(const RecordChannelHandle& other) const {
    return socket_path_ == other.socket_path_;
  }

  bool operator!=(const RecordChannelHandle& other) const {
    return !(*this == other);
  }

private:
  std::string socket_path_;
};

}  // namespace channel
}  // namespace funnel

#endif  // FUNNEL_CHANNEL_HANDLE_HPP
