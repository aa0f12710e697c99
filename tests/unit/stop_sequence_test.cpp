#include "internal/lifecycle/stop_sequence.hpp"

#include <signal.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "support/fake_process_table.hpp"
#include "support/temp_dir.hpp"

namespace {

using stackctl::db::sqlite::ProbeStatus;
using stackctl::lifecycle::LockInspector;
using stackctl::lifecycle::PortReclaimer;
using stackctl::lifecycle::ProcessLocator;
using stackctl::lifecycle::ShutdownVerifier;
using stackctl::lifecycle::StopSequence;
using stackctl::model::StopState;
using stackctl::runtime::config::ProcessPattern;
using stackctl::testing::FakeProcessTable;

struct Fixture {
  std::shared_ptr<FakeProcessTable> table = std::make_shared<FakeProcessTable>();
  std::filesystem::path             db;
  std::shared_ptr<StopSequence>     stop;

  explicit Fixture(const std::string& name) {
    db = stackctl::testing::MakeTempDir(name) / "letters.db";
    stackctl::testing::WriteFile(db, "");

    std::vector<ProcessPattern> patterns(2);
    patterns[0].set_pattern("next dev");
    patterns[0].set_category(ProcessPattern::WEB);
    patterns[1].set_pattern("production_pipeline");
    patterns[1].set_category(ProcessPattern::PIPELINE);

    auto locator   = std::make_shared<ProcessLocator>(table, patterns);
    auto reclaimer = std::make_shared<PortReclaimer>(table, std::vector<std::uint16_t>{3000, 3001, 3002});
    auto inspector = std::make_shared<LockInspector>(table, db);
    auto verifier  = std::make_shared<ShutdownVerifier>(locator, reclaimer, db, std::chrono::milliseconds(0));
    stop           = std::make_shared<StopSequence>(locator, reclaimer, inspector, verifier);
  }
};

void TestTransitions() {
  using stackctl::model::CanTransition;

  static_assert(CanTransition(StopState::kRunning, StopState::kSignaling));
  static_assert(CanTransition(StopState::kSignaling, StopState::kSettling));
  static_assert(CanTransition(StopState::kSettling, StopState::kVerified));
  static_assert(CanTransition(StopState::kSettling, StopState::kPartiallyStopped));
  static_assert(!CanTransition(StopState::kRunning, StopState::kVerified));
  static_assert(!CanTransition(StopState::kSignaling, StopState::kVerified));
  static_assert(!CanTransition(StopState::kVerified, StopState::kSignaling));
  static_assert(stackctl::model::IsTerminal(StopState::kPartiallyStopped));
}

void TestFullStackStopsAndVerifies() {
  Fixture fx("stop_full");
  fx.table->AddProcess(1, "node node_modules/.bin/next dev");
  fx.table->AddProcess(2, "python3 production_pipeline.py");
  fx.table->AddProcess(3, "node .next/server.js");
  fx.table->Listen(3, 3001);
  fx.table->Hold(2, fx.db);

  auto report = fx.stop->Run();

  assert(report.state == StopState::kVerified);
  assert(report.located.signaled == 2);
  assert(report.ports.killed == 1);
  assert(report.verify.ProcessesStopped());
  assert(report.verify.PortsFree());
  assert(report.verify.probe.status == ProbeStatus::kAccessible);
  assert(!report.NothingToDo());
}

void TestSecondPassIsNothingToDo() {
  Fixture fx("stop_idempotent");
  fx.table->AddProcess(1, "next dev");
  fx.table->Listen(1, 3000);

  assert(fx.stop->Run().state == StopState::kVerified);

  const auto signals_after_first = fx.table->signals().size();
  auto       second              = fx.stop->Run();

  assert(second.state == StopState::kVerified);
  assert(second.NothingToDo());
  assert(fx.table->signals().size() == signals_after_first);
}

void TestSurvivorIsPartiallyStopped() {
  Fixture fx("stop_survivor");
  fx.table->AddProcess(1, "next dev");
  fx.table->IgnoreSignals(1);

  auto report = fx.stop->Run();

  assert(report.state == StopState::kPartiallyStopped);
  assert(report.verify.remaining_processes == 1);
  assert(report.verify.DatabaseUnlocked());
}

void TestHeldDatabaseLockReportedSeparately() {
  Fixture fx("stop_locked");

  stackctl::db::sqlite::SqliteDB holder(fx.db.string(), stackctl::db::sqlite::SqliteDB::Mode::kReadWrite);
  holder.Exec("BEGIN IMMEDIATE;");

  auto locked = fx.stop->Run();
  assert(locked.state == StopState::kPartiallyStopped);
  assert(locked.verify.ProcessesStopped());
  assert(locked.verify.probe.status == ProbeStatus::kLocked);

  holder.Exec("ROLLBACK;");

  auto released = fx.stop->Run();
  assert(released.state == StopState::kVerified);
  assert(released.verify.probe.status == ProbeStatus::kAccessible);
}

void TestMissingDatabaseIsNotALock() {
  Fixture fx("stop_no_db");
  std::filesystem::remove(fx.db);

  auto report = fx.stop->Run();
  assert(report.state == StopState::kVerified);
  assert(report.verify.probe.status == ProbeStatus::kMissing);
}

} // namespace

int main() {
  TestTransitions();
  TestFullStackStopsAndVerifies();
  TestSecondPassIsNothingToDo();
  TestSurvivorIsPartiallyStopped();
  TestHeldDatabaseLockReportedSeparately();
  TestMissingDatabaseIsNotALock();

  std::cout << "stackctl_unit_stop_sequence: pass\n";
  return 0;
}
