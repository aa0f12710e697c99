#include "internal/lifecycle/lock_inspector.hpp"

#include <signal.h>

#include <cassert>
#include <iostream>
#include <memory>

#include "support/fake_process_table.hpp"
#include "support/temp_dir.hpp"

namespace {

using stackctl::lifecycle::LockInspector;
using stackctl::lifecycle::LockOutcome;
using stackctl::testing::FakeProcessTable;

void TestMissingFileIsNoLock() {
  const auto dir   = stackctl::testing::MakeTempDir("lock_missing");
  auto       table = std::make_shared<FakeProcessTable>();
  table->Hold(5, dir / "letters.db");

  LockInspector inspector(table, dir / "letters.db");
  auto          report = inspector.Clear();

  assert(report.outcome == LockOutcome::kNoFile);
  assert(table->signals().empty());
}

void TestSingleHolderIsKilled() {
  const auto dir = stackctl::testing::MakeTempDir("lock_single");
  const auto db  = dir / "letters.db";
  stackctl::testing::WriteFile(db, "");

  auto table = std::make_shared<FakeProcessTable>();
  table->AddProcess(77, "python3 production_pipeline.py");
  table->Hold(77, db);

  LockInspector inspector(table, db);
  auto          report = inspector.Clear();

  assert(report.outcome == LockOutcome::kCleared);
  assert(report.killed == 1);
  assert(table->SignalCount(SIGKILL) == 1);
  assert(inspector.Inspect().holders.empty());
}

void TestSidecarHoldersCountedOncePerProcess() {
  const auto dir = stackctl::testing::MakeTempDir("lock_sidecar");
  const auto db  = dir / "letters.db";
  stackctl::testing::WriteFile(db, "");

  auto table = std::make_shared<FakeProcessTable>();
  table->Hold(11, db);
  table->Hold(11, db.string() + "-wal");
  table->Hold(12, db.string() + "-shm");

  LockInspector inspector(table, db);
  auto          report = inspector.Clear();

  assert(report.holders.size() == 2);
  assert(report.holders[0].process.pid == 11);
  assert(report.holders[0].paths.size() == 2);
  assert(report.holders[1].paths.size() == 1);
  assert(report.killed == 2);
  assert(table->SignalCount(SIGKILL) == 2);
}

void TestNoHoldersAndPrivilegeWarning() {
  const auto dir = stackctl::testing::MakeTempDir("lock_none");
  const auto db  = dir / "letters.db";
  stackctl::testing::WriteFile(db, "");

  auto table = std::make_shared<FakeProcessTable>();
  table->SetUninspectable(4);

  LockInspector inspector(table, db);
  auto          report = inspector.Clear();

  assert(report.outcome == LockOutcome::kNoHolders);
  assert(report.uninspectable == 4);
}

void TestProtectedHolderLeavesIncomplete() {
  const auto dir = stackctl::testing::MakeTempDir("lock_protected");
  const auto db  = dir / "letters.db";
  stackctl::testing::WriteFile(db, "");

  auto table = std::make_shared<FakeProcessTable>();
  table->Hold(1, db);
  table->Protect(1);

  LockInspector inspector(table, db);
  assert(inspector.Clear().outcome == LockOutcome::kIncomplete);
}

void TestLockPathsIncludeSidecars() {
  auto paths = LockInspector::LockPaths("/data/letters.db");
  assert(paths.size() == 4);
  assert(paths[0] == "/data/letters.db");
  assert(paths[1] == "/data/letters.db-wal");
  assert(paths[2] == "/data/letters.db-shm");
  assert(paths[3] == "/data/letters.db-journal");
}

} // namespace

int main() {
  TestMissingFileIsNoLock();
  TestSingleHolderIsKilled();
  TestSidecarHoldersCountedOncePerProcess();
  TestNoHoldersAndPrivilegeWarning();
  TestProtectedHolderLeavesIncomplete();
  TestLockPathsIncludeSidecars();

  std::cout << "stackctl_unit_lock_inspector: pass\n";
  return 0;
}
