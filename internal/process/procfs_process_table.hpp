#pragma once

#include <filesystem>

#include "internal/process/process_table.hpp"

namespace stackctl::process {

/*
  ProcessTable backed by Linux procfs.

    processes  → /proc/<pid>/cmdline
    listeners  → /proc/net/tcp{,6} (state LISTEN) joined with
                 /proc/<pid>/fd/* → "socket:[inode]"
    holders    → /proc/<pid>/fd/* → canonical file path

  Reading another user's fd table needs CAP_SYS_PTRACE or root; those
  processes are counted as uninspectable rather than treated as errors.
  A listening socket that no readable fd table refers to is reported as
  unattributed, never as a free port.
*/
class ProcfsProcessTable final : public ProcessTable {
 public:
  explicit ProcfsProcessTable(std::filesystem::path proc_root = "/proc");

  std::vector<ProcessEntry> ListProcesses() override;

  ListenerScan ListenersOn(std::uint16_t port) override;

  HolderScan HoldersOf(const std::vector<std::filesystem::path>& paths) override;

  SignalResult Signal(pid_t pid, int signal) override;

 private:
  std::vector<pid_t> Pids() const;
  std::string        CommandLine(pid_t pid) const;

  std::filesystem::path proc_root_;
  pid_t                 self_;
};

} // namespace stackctl::process
