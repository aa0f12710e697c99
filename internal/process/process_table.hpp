#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/process.hpp"

namespace stackctl::process {

struct ProcessEntry {
  pid_t       pid = 0;
  std::string command_line;
};

enum class SignalResult {
  kDelivered,
  kGone,   // exited between scan and signal
  kDenied, // EPERM
};

struct ListenerScan {
  std::vector<stackctl::model::ProcessHandle> owners;
  // Sockets listening on the port that no inspectable process owns.
  std::size_t unattributed = 0;
};

struct HolderScan {
  std::vector<stackctl::model::LockHolder> holders;
  // Processes whose descriptor table could not be read (privilege).
  std::size_t uninspectable = 0;
};

/*
  Operating-system process view.

  All scans exclude the calling process. Every call reflects the system
  at the moment it runs; results go stale immediately, so callers treat
  them as best-effort.

  Implementations:
    ProcfsProcessTable → Linux /proc
*/
class ProcessTable {
 public:
  virtual ~ProcessTable() = default;

  // Processes with a non-empty command line (argv joined by spaces).
  virtual std::vector<ProcessEntry> ListProcesses() = 0;

  // Every process owning a TCP socket listening on |port| (IPv4 and IPv6).
  virtual ListenerScan ListenersOn(std::uint16_t port) = 0;

  // Every process holding one of |paths| open, one entry per process.
  virtual HolderScan HoldersOf(const std::vector<std::filesystem::path>& paths) = 0;

  virtual SignalResult Signal(pid_t pid, int signal) = 0;
};

using ProcessTablePtr = std::shared_ptr<ProcessTable>;

} // namespace stackctl::process
