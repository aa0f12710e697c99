#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace stackctl::model {

using PatternCategory = stackctl::runtime::config::ProcessPattern::Category;

/*
  A process discovered by one scan. Owned by the pass that found it and
  never persisted; the pid may be reused by the OS after the pass ends.
*/
struct ProcessHandle {
  pid_t           pid = 0;
  std::string     command_line;
  PatternCategory category = stackctl::runtime::config::ProcessPattern::CATEGORY_UNSPECIFIED;
};

struct PortBinding {
  std::uint16_t              port = 0;
  std::vector<ProcessHandle> owners;
  // Listening sockets on the port whose owner could not be inspected.
  std::size_t unattributed = 0;

  bool Free() const {
    return owners.empty() && unattributed == 0;
  }
};

// One per process; |paths| lists the database file and sidecars it holds.
struct LockHolder {
  ProcessHandle                      process;
  std::vector<std::filesystem::path> paths;
};

const char* CategoryName(PatternCategory category);

} // namespace stackctl::model
