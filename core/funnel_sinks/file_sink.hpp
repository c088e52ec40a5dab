// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FUNNEL_SINKS_FILE_SINK_HPP
#define FUNNEL_SINKS_FILE_SINK_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

#include "sink.hpp"

namespace funnel {
namespace sinks {

/**
 * Plain file sink. The file is opened at construction and stays open for the
 * lifetime of the sink.
 */
class FileSink : public Sink {
public:
  /**
   * @param path File to write; its directory must already exist
   * @param mode "a" to append, "w" to truncate
   * @param encoding Only UTF-8 ("utf-8", "utf8", case-insensitive) is supported
   * @throws SinkConstructionError if the file cannot be opened
   */
  FileSink(const std::string& path, const std::string& mode, const std::string& encoding);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  void write(const std::string& line, severity_level level) override;
  void flush() override;
  void close() override;

  std::string target() const override {
    return path_;
  }

  const std::string& path() const {
    return path_;
  }

  /**
   * Bytes in the current file, including what was there before opening.
   */
  uint64_t size() const {
    return size_;
  }

  bool is_open() const {
    return stream_.is_open();
  }

  /**
   * True once close() was called. A stream left closed by a failed
   * rotation is reopened by the next write instead.
   */
  bool is_closed() const {
    return closed_;
  }

protected:
  /**
   * Last modification time of the file as it existed before construction.
   */
  const std::optional<std::chrono::system_clock::time_point>& initial_mtime() const {
    return initial_mtime_;
  }

  /**
   * Close and reopen the file, truncating it.
   * @throws SinkWriteError if the file cannot be reopened
   */
  void reopen_truncated();

  /**
   * Reopen the file for appending after a rotation left it closed.
   * @throws SinkWriteError if the file cannot be reopened
   */
  void reopen_appending();

  void close_stream();

  void append(const std::string& line);

private:
  std::string path_;
  std::ofstream stream_;
  uint64_t size_ = 0;
  bool closed_ = false;
  std::optional<std::chrono::system_clock::time_point> initial_mtime_;
};

}  // namespace sinks
}  // namespace funnel

#endif  // FUNNEL_SINKS_FILE_SINK_HPP
