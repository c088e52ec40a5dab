// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_sink.hpp"

#include <boost/filesystem.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>

#include "funnel_errors.hpp"

namespace funnel {
namespace sinks {

namespace fs = boost::filesystem;

namespace {

bool is_utf8(const std::string& encoding) {
  std::string lower = encoding;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return lower == "utf-8" || lower == "utf8" || lower == "utf_8";
}

}  // namespace

FileSink::FileSink(const std::string& path, const std::string& mode, const std::string& encoding)
    : path_(path) {
  if (path.empty()) {
    throw SinkConstructionError(path, "empty file name");
  }
  if (mode != "a" && mode != "w") {
    throw SinkConstructionError(path, "unsupported mode '" + mode + "'");
  }
  if (!is_utf8(encoding)) {
    throw SinkConstructionError(path, "unsupported encoding '" + encoding + "'");
  }

  fs::path file_path(path);
  fs::path parent = file_path.parent_path();
  if (parent.empty()) {
    parent = fs::current_path();
  }

  boost::system::error_code ec;
  if (!fs::is_directory(parent, ec)) {
    throw SinkConstructionError(path, "directory '" + parent.string() + "' does not exist");
  }
  if (fs::is_directory(file_path, ec)) {
    throw SinkConstructionError(path, "path is a directory");
  }

  if (fs::exists(file_path, ec)) {
    std::time_t mtime = fs::last_write_time(file_path, ec);
    if (!ec) {
      initial_mtime_ = std::chrono::system_clock::from_time_t(mtime);
    }
  }

  std::ios::openmode open_mode = std::ios::out | std::ios::binary;
  open_mode |= (mode == "a") ? std::ios::app : std::ios::trunc;
  stream_.open(path, open_mode);
  if (!stream_.is_open()) {
    throw SinkConstructionError(path, "cannot open file for writing");
  }

  if (mode == "a") {
    uint64_t existing = fs::file_size(file_path, ec);
    size_ = ec ? 0 : existing;
  }
}

FileSink::~FileSink() {
  close_stream();
}

void FileSink::append(const std::string& line) {
  if (closed_) {
    throw SinkWriteError("File sink '" + path_ + "' is closed");
  }
  if (!stream_.is_open()) {
    reopen_appending();
  }
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_.good()) {
    stream_.clear();
    throw SinkWriteError("Failed to write to '" + path_ + "'");
  }
  size_ += line.size() + 1;
}

void FileSink::write(const std::string& line, severity_level /*level*/) {
  append(line);
}

void FileSink::flush() {
  if (stream_.is_open()) {
    stream_.flush();
  }
}

void FileSink::close() {
  closed_ = true;
  close_stream();
}

void FileSink::close_stream() {
  if (stream_.is_open()) {
    stream_.flush();
    stream_.close();
  }
}

void FileSink::reopen_truncated() {
  close_stream();
  stream_.clear();
  stream_.open(path_, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!stream_.is_open()) {
    throw SinkWriteError("Cannot reopen '" + path_ + "'");
  }
  size_ = 0;
}

void FileSink::reopen_appending() {
  stream_.clear();
  stream_.open(path_, std::ios::out | std::ios::binary | std::ios::app);
  if (!stream_.is_open()) {
    throw SinkWriteError("Cannot reopen '" + path_ + "'");
  }
  boost::system::error_code ec;
  uint64_t existing = fs::file_size(fs::path(path_), ec);
  size_ = ec ? 0 : existing;
}

}  // namespace sinks
}  // namespace funnel
