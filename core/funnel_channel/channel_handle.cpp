// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "channel_handle.hpp"

#include <boost/filesystem.hpp>

#include <cstring>
#include <stdexcept>

namespace funnel {
namespace channel {

RecordChannelHandle RecordChannelHandle::from_string(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("Empty channel handle");
  }
  const size_t scheme_len = std::strlen(kScheme);
  if (text.compare(0, scheme_len, kScheme) != 0) {
    throw std::invalid_argument("Unsupported channel handle '" + text + "'");
  }
  std::string path = text.substr(scheme_len);
  if (path.empty()) {
    throw std::invalid_argument("Channel handle '" + text + "' has no socket path");
  }
  return RecordChannelHandle(path);
}

RecordChannelHandle RecordChannelHandle::generate(const std::string& socket_dir) {
  namespace fs = boost::filesystem;
  fs::path dir = socket_dir.empty() ? fs::temp_directory_path() : fs::path(socket_dir);
  fs::path name = fs::unique_path("funnel-%%%%-%%%%-%%%%.sock");
  return RecordChannelHandle((dir / name).string());
}

std::string RecordChannelHandle::to_string() const {
  return std::string(kScheme) + socket_path_;
}

}  // namespace channel
}  // namespace funnel
