#include "internal/process/procfs_process_table.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/lifecycle/lock_inspector.hpp"
#include "internal/lifecycle/port_reclaimer.hpp"
#include "internal/lifecycle/process_locator.hpp"

namespace {

namespace fs = std::filesystem;

using stackctl::db::sqlite::ProbeStatus;
using stackctl::lifecycle::LockInspector;
using stackctl::lifecycle::LockOutcome;
using stackctl::lifecycle::PortOutcome;
using stackctl::lifecycle::PortReclaimer;
using stackctl::lifecycle::ProcessLocator;
using stackctl::process::ProcfsProcessTable;
using stackctl::runtime::config::ProcessPattern;

// Blocks until the child writes one int to |fd|.
int ReadInt(int fd) {
  int value = 0;
  assert(read(fd, &value, sizeof(value)) == static_cast<ssize_t>(sizeof(value)));
  return value;
}

void WriteInt(int fd, int value) {
  if (write(fd, &value, sizeof(value)) != static_cast<ssize_t>(sizeof(value))) {
    _exit(2);
  }
}

/*
  fork() whose child is SIGKILLed when this test process dies, so a failed
  assert never leaves a paused child holding the test runner's pipes.
*/
pid_t ForkChild() {
  const pid_t parent = getpid();
  const pid_t pid    = fork();
  assert(pid >= 0);
  if (pid == 0) {
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0 || getppid() != parent) {
      _exit(1);
    }
  }
  return pid;
}

int WaitSignal(pid_t pid) {
  int status = 0;
  assert(waitpid(pid, &status, 0) == pid);
  assert(WIFSIGNALED(status));
  return WTERMSIG(status);
}

void TestLocatorTerminatesDecoratedChild() {
  const std::string token = "30." + std::to_string(getpid());

  pid_t child = ForkChild();
  if (child == 0) {
    execl("/bin/sleep", "sleep", token.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }

  auto           table = std::make_shared<ProcfsProcessTable>();
  ProcessPattern pattern;
  pattern.set_pattern("sleep " + token);
  pattern.set_category(ProcessPattern::APP);
  ProcessLocator locator(table, {pattern});

  // wait for exec to replace the forked command line
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (locator.Scan().empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  auto matched = locator.Scan();
  assert(matched.size() == 1);
  assert(matched[0].pid == child);

  auto result = locator.TerminateMatches();
  assert(result.signaled == 1);
  assert(WaitSignal(child) == SIGTERM);

  assert(locator.Scan().empty());
  assert(locator.TerminateMatches().signaled == 0);
}

void TestReclaimerKillsListener() {
  int ready[2];
  assert(pipe(ready) == 0);

  pid_t child = ForkChild();
  if (child == 0) {
    close(ready[0]);
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    socklen_t len        = sizeof(addr);
    if (fd < 0 || bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || listen(fd, 1) != 0 ||
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      _exit(1);
    }
    WriteInt(ready[1], ntohs(addr.sin_port));
    for (;;) pause();
  }

  close(ready[1]);
  const auto port = static_cast<std::uint16_t>(ReadInt(ready[0]));
  close(ready[0]);

  auto          table = std::make_shared<ProcfsProcessTable>();
  PortReclaimer reclaimer(table, {port});

  auto bindings = reclaimer.Bindings();
  assert(bindings.size() == 1);
  assert(bindings[0].owners.size() == 1);
  assert(bindings[0].owners[0].pid == child);

  auto result = reclaimer.Reclaim();
  assert(result.killed == 1);
  assert(result.ports[0].outcome == PortOutcome::kCleared);
  assert(WaitSignal(child) == SIGKILL);

  assert(reclaimer.Bindings()[0].Free());
  assert(reclaimer.Reclaim().ports[0].outcome == PortOutcome::kFree);
}

void TestLockInspectorClearsHolder() {
  const auto dir = fs::temp_directory_path() / "stackctl_tests" / ("procfs_lock_" + std::to_string(getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  const auto db = dir / "letters.db";
  { std::ofstream touch(db); }

  int ready[2];
  assert(pipe(ready) == 0);

  pid_t child = ForkChild();
  if (child == 0) {
    close(ready[0]);
    try {
      stackctl::db::sqlite::SqliteDB holder(db.string(), stackctl::db::sqlite::SqliteDB::Mode::kReadWrite);
      holder.Exec("BEGIN IMMEDIATE;");
      WriteInt(ready[1], 1);
      for (;;) pause();
    } catch (const std::exception&) {
      _exit(1);
    }
  }

  close(ready[1]);
  assert(ReadInt(ready[0]) == 1);
  close(ready[0]);

  assert(stackctl::db::sqlite::ProbeWritable(db).status == ProbeStatus::kLocked);

  auto          table = std::make_shared<ProcfsProcessTable>();
  LockInspector inspector(table, db);

  // the connection keeps the database and its rollback journal open
  auto scan = inspector.Inspect();
  assert(scan.holders.size() == 1);
  assert(scan.holders[0].process.pid == child);
  assert(!scan.holders[0].paths.empty());

  auto report = inspector.Clear();
  assert(report.outcome == LockOutcome::kCleared);
  assert(report.killed == 1);
  assert(WaitSignal(child) == SIGKILL);

  assert(inspector.Inspect().holders.empty());
  assert(stackctl::db::sqlite::ProbeWritable(db).status == ProbeStatus::kAccessible);
}

} // namespace

int main() {
  TestLocatorTerminatesDecoratedChild();
  TestReclaimerKillsListener();
  TestLockInspectorClearsHolder();

  std::cout << "stackctl_integration_procfs_process_table: pass\n";
  return 0;
}
