#include "procfs_process_table.hpp"

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace stackctl::process {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTcpListenState = "0A";

bool ParsePid(const std::string& name, pid_t* pid) {
  if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  *pid = static_cast<pid_t>(std::strtol(name.c_str(), nullptr, 10));
  return *pid > 0;
}

/*
  /proc/net/tcp line:
    sl local_address rem_address st tx:rx tr:when retrnsmt uid timeout inode ...
  local_address is HEXIP:HEXPORT.
*/
void CollectListenInodes(const fs::path& table, std::uint16_t port, std::set<std::string>* inodes) {
  std::ifstream in(table);
  if (!in) {
    return;
  }

  std::string line;
  std::getline(in, line); // header
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string        slot, local, remote, state, queues, timer, retransmits, uid, timeout, inode;
    if (!(fields >> slot >> local >> remote >> state >> queues >> timer >> retransmits >> uid >> timeout >> inode)) {
      continue;
    }
    if (state != kTcpListenState) {
      continue;
    }

    const auto colon = local.rfind(':');
    if (colon == std::string::npos) {
      continue;
    }
    const auto local_port = std::strtoul(local.c_str() + colon + 1, nullptr, 16);
    if (local_port == port && inode != "0") {
      inodes->insert("socket:[" + inode + "]");
    }
  }
}

/*
  Calls |fn| with the link target of every descriptor of |pid|.
  Returns false when the fd directory exists but cannot be read.
*/
template <typename Fn>
bool ForEachDescriptor(const fs::path& proc_root, pid_t pid, Fn&& fn) {
  std::error_code ec;
  fs::directory_iterator it(proc_root / std::to_string(pid) / "fd", ec);
  if (ec) {
    return ec != std::errc::permission_denied;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code link_ec;
    auto            target = fs::read_symlink(it->path(), link_ec);
    if (!link_ec) {
      fn(target.string());
    }
  }
  return true;
}

} // namespace

ProcfsProcessTable::ProcfsProcessTable(fs::path proc_root) : proc_root_(std::move(proc_root)), self_(getpid()) {
}

std::vector<pid_t> ProcfsProcessTable::Pids() const {
  std::vector<pid_t> pids;
  std::error_code    ec;
  for (fs::directory_iterator it(proc_root_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    pid_t pid = 0;
    if (ParsePid(it->path().filename().string(), &pid) && pid != self_) {
      pids.push_back(pid);
    }
  }
  return pids;
}

std::string ProcfsProcessTable::CommandLine(pid_t pid) const {
  std::ifstream in(proc_root_ / std::to_string(pid) / "cmdline", std::ios::binary);
  if (!in) {
    return {};
  }

  std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  while (!raw.empty() && raw.back() == '\0') {
    raw.pop_back();
  }
  std::replace(raw.begin(), raw.end(), '\0', ' ');
  return raw;
}

std::vector<ProcessEntry> ProcfsProcessTable::ListProcesses() {
  std::vector<ProcessEntry> entries;
  for (auto pid : Pids()) {
    auto command_line = CommandLine(pid);
    // kernel threads and already-reaped processes have no command line
    if (command_line.empty()) {
      continue;
    }
    entries.push_back({pid, std::move(command_line)});
  }
  return entries;
}

ListenerScan ProcfsProcessTable::ListenersOn(std::uint16_t port) {
  std::set<std::string> inodes;
  CollectListenInodes(proc_root_ / "net" / "tcp", port, &inodes);
  CollectListenInodes(proc_root_ / "net" / "tcp6", port, &inodes);

  ListenerScan scan;
  if (inodes.empty()) {
    return scan;
  }

  std::set<std::string> attributed;
  for (auto pid : Pids()) {
    bool owns = false;
    ForEachDescriptor(proc_root_, pid, [&](const std::string& target) {
      if (inodes.count(target) > 0) {
        owns = true;
        attributed.insert(target);
      }
    });
    if (owns) {
      stackctl::model::ProcessHandle handle;
      handle.pid          = pid;
      handle.command_line = CommandLine(pid);
      scan.owners.push_back(std::move(handle));
    }
  }

  // owner's fd table unreadable, or the socket closed mid-scan
  scan.unattributed = inodes.size() - attributed.size();
  return scan;
}

HolderScan ProcfsProcessTable::HoldersOf(const std::vector<fs::path>& paths) {
  std::set<std::string> wanted;
  for (const auto& path : paths) {
    std::error_code ec;
    auto            canonical = fs::weakly_canonical(path, ec);
    wanted.insert(ec ? path.string() : canonical.string());
  }

  HolderScan scan;
  for (auto pid : Pids()) {
    std::set<std::string> held;
    const bool readable = ForEachDescriptor(proc_root_, pid, [&](const std::string& target) {
      if (wanted.count(target) > 0) {
        held.insert(target);
      }
    });
    if (!readable) {
      ++scan.uninspectable;
      continue;
    }

    if (held.empty()) {
      continue;
    }

    stackctl::model::LockHolder holder;
    holder.process.pid          = pid;
    holder.process.command_line = CommandLine(pid);
    holder.paths.assign(held.begin(), held.end());
    scan.holders.push_back(std::move(holder));
  }
  return scan;
}

SignalResult ProcfsProcessTable::Signal(pid_t pid, int signal) {
  if (::kill(pid, signal) == 0) {
    return SignalResult::kDelivered;
  }
  return errno == ESRCH ? SignalResult::kGone : SignalResult::kDenied;
}

} // namespace stackctl::process
