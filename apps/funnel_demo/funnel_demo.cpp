// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * funnel_demo - exercises the logger facade across process boundaries
 *
 * Owner mode starts an aggregation owner, spawns worker copies of this
 * binary connected to the owner's channel, waits for them and stops.
 * Worker mode connects to a given channel and emits a fixed number of
 * records on channel "worker.<id>".
 */

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "channel_handle.hpp"
#include "funnel_errors.hpp"
#include "logger_facade.hpp"
#include "logging_scope.hpp"

extern char** environ;

namespace {

using funnel::channel::RecordChannelHandle;
using funnel::pipeline::LoggerFacade;
using funnel::pipeline::LoggingScope;

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " --config <file> [options]\n"
    << "\n"
    << "Owner options:\n"
    << "  --workers <n>        Worker processes to spawn (default: 3)\n"
    << "  --records <n>        Records each process emits (default: 5)\n"
    << "  --single             Run standalone without spawning workers\n"
    << "\n"
    << "Worker options:\n"
    << "  --worker <handle>    Connect to an owner's channel (unix:<path>)\n"
    << "  --id <n>             Worker index used in the channel name\n"
    << "\n"
    << "Other:\n"
    << "  --help               Show this help message\n"
    << std::endl;
}

bool parse_count(const char* text, int& out) {
  char* end = nullptr;
  errno = 0;
  long value = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || value < 0 || value > 1000000) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

std::string self_executable(const char* argv0) {
  std::vector<char> buffer(4096);
  ssize_t length = ::readlink("/proc/self/exe", buffer.data(), buffer.size() - 1);
  if (length <= 0) {
    return argv0;
  }
  return std::string(buffer.data(), static_cast<size_t>(length));
}

int run_worker(const std::string& config_path, const std::string& handle_text, int id, int records) {
  RecordChannelHandle handle = RecordChannelHandle::from_string(handle_text);
  LoggingScope scope(std::make_unique<LoggerFacade>(config_path, handle));

  auto log = scope->get_channel("worker." + std::to_string(id));
  for (int k = 0; k < records; ++k) {
    FUNNEL_CHANNEL_INFO(log, "record " << k);
  }
  if (!scope->flush()) {
    std::cerr << "Worker " << id << ": channel to owner was lost" << std::endl;
    return 1;
  }
  return 0;
}

int run_single(const std::string& config_path, int records) {
  LoggingScope scope(std::make_unique<LoggerFacade>(config_path));
  auto log = scope->get_channel("demo");
  log.info("standalone run");
  for (int k = 0; k < records; ++k) {
    FUNNEL_CHANNEL_INFO(log, "record " << k);
  }
  log.warning("standalone run finished");
  return 0;
}

int run_owner(const std::string& self, const std::string& config_path, int workers, int records) {
  LoggingScope scope(std::make_unique<LoggerFacade>(config_path, true));
  auto log = scope->get_channel("demo.owner");

  auto handle = scope->get_channel_handle_for_workers();
  if (!handle) {
    std::cerr << "Error: owner has no channel for workers" << std::endl;
    return 1;
  }
  const std::string handle_text = handle->to_string();
  log.info("owner listening on " + handle_text);

  std::vector<pid_t> pids;
  for (int w = 0; w < workers; ++w) {
    std::string id = std::to_string(w);
    std::string count = std::to_string(records);
    std::vector<char*> argv = {
      const_cast<char*>(self.c_str()),
      const_cast<char*>("--config"),
      const_cast<char*>(config_path.c_str()),
      const_cast<char*>("--worker"),
      const_cast<char*>(handle_text.c_str()),
      const_cast<char*>("--id"),
      const_cast<char*>(id.c_str()),
      const_cast<char*>("--records"),
      const_cast<char*>(count.c_str()),
      nullptr
    };

    pid_t pid = 0;
    int rc = posix_spawn(&pid, self.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
      FUNNEL_CHANNEL_ERROR(log, "failed to spawn worker " << w << ": " << std::strerror(rc));
      continue;
    }
    pids.push_back(pid);
    FUNNEL_CHANNEL_INFO(log, "spawned worker " << w << " pid=" << pid);
  }

  int failed = 0;
  for (size_t i = 0; i < pids.size(); ++i) {
    int status = 0;
    if (::waitpid(pids[i], &status, 0) != pids[i] || !WIFEXITED(status) ||
        WEXITSTATUS(status) != 0) {
      ++failed;
      FUNNEL_CHANNEL_WARN(log, "worker " << i << " did not exit cleanly");
    } else {
      FUNNEL_CHANNEL_INFO(log, "worker " << i << " finished");
    }
  }

  log.info("all workers finished");
  return (failed == 0 && static_cast<int>(pids.size()) == workers) ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string worker_handle;
  int worker_id = 0;
  int workers = 3;
  int records = 5;
  bool single = false;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else if (strcmp(argv[i], "--config") == 0) {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--worker") == 0) {
      if (i + 1 < argc) {
        worker_handle = argv[++i];
      } else {
        std::cerr << "Error: --worker requires a channel handle argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--id") == 0) {
      if (i + 1 < argc && parse_count(argv[i + 1], worker_id)) {
        ++i;
      } else {
        std::cerr << "Error: --id requires a non-negative integer argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--workers") == 0) {
      if (i + 1 < argc && parse_count(argv[i + 1], workers)) {
        ++i;
      } else {
        std::cerr << "Error: --workers requires a non-negative integer argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--records") == 0) {
      if (i + 1 < argc && parse_count(argv[i + 1], records)) {
        ++i;
      } else {
        std::cerr << "Error: --records requires a non-negative integer argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--single") == 0) {
      single = true;
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  if (config_path.empty()) {
    std::cerr << "Error: --config is required" << std::endl;
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (!worker_handle.empty()) {
      return run_worker(config_path, worker_handle, worker_id, records);
    }
    if (single) {
      return run_single(config_path, records);
    }
    return run_owner(self_executable(argv[0]), config_path, workers, records);
  } catch (const funnel::FunnelError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
