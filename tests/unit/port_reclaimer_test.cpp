#include "internal/lifecycle/port_reclaimer.hpp"

#include <signal.h>

#include <cassert>
#include <iostream>
#include <memory>

#include "support/fake_process_table.hpp"

namespace {

using stackctl::lifecycle::PortOutcome;
using stackctl::lifecycle::PortReclaimer;
using stackctl::testing::FakeProcessTable;

void TestReclaimsOnlyBoundPorts() {
  auto table = std::make_shared<FakeProcessTable>();
  table->AddProcess(3100, "node next-server 3000");
  table->AddProcess(3300, "node next-server 3002");
  table->Listen(3100, 3000);
  table->Listen(3300, 3002);

  PortReclaimer reclaimer(table, {3000, 3001, 3002});
  auto          result = reclaimer.Reclaim();

  assert(result.killed == 2);
  assert(result.ports.size() == 3);
  assert(result.ports[0].outcome == PortOutcome::kCleared);
  assert(result.ports[1].port == 3001);
  assert(result.ports[1].outcome == PortOutcome::kFree);
  assert(result.ports[2].outcome == PortOutcome::kCleared);
  assert(result.AllReclaimed());

  assert(table->SignalCount(SIGKILL) == 2);
  assert(table->SignalCount(SIGTERM) == 0);

  for (const auto& binding : reclaimer.Bindings()) {
    assert(binding.Free());
  }
}

void TestEverySharedListenerIsKilled() {
  auto table = std::make_shared<FakeProcessTable>();
  table->Listen(41, 3000);
  table->Listen(42, 3000);

  PortReclaimer reclaimer(table, {3000});
  auto          result = reclaimer.Reclaim();

  assert(result.ports[0].owners.size() == 2);
  assert(result.ports[0].killed == 2);
  assert(!table->Alive(41));
  assert(!table->Alive(42));
}

void TestDeniedKillFailsThePort() {
  auto table = std::make_shared<FakeProcessTable>();
  table->Listen(1, 3001);
  table->Protect(1);

  PortReclaimer reclaimer(table, {3000, 3001});
  auto          result = reclaimer.Reclaim();

  assert(result.ports[0].outcome == PortOutcome::kFree);
  assert(result.ports[1].outcome == PortOutcome::kFailed);
  assert(!result.AllReclaimed());
  assert(result.killed == 0);
}

void TestOwnerGoneBeforeKillStillClears() {
  auto table = std::make_shared<FakeProcessTable>();
  table->Listen(9, 3002);
  table->VanishOnSignal(9);

  PortReclaimer reclaimer(table, {3002});
  auto          result = reclaimer.Reclaim();

  assert(result.ports[0].outcome == PortOutcome::kCleared);
  assert(result.ports[0].killed == 0);
  assert(result.AllReclaimed());
}

void TestUninspectableListenerIsNeverFree() {
  auto table = std::make_shared<FakeProcessTable>();
  table->ListenUnattributed(3001);

  PortReclaimer reclaimer(table, {3000, 3001});
  auto          result = reclaimer.Reclaim();

  assert(result.ports[0].outcome == PortOutcome::kFree);
  assert(result.ports[1].outcome == PortOutcome::kFailed);
  assert(result.ports[1].owners.empty());
  assert(result.ports[1].unattributed == 1);
  assert(!result.AllReclaimed());
  assert(table->signals().empty());

  auto bindings = reclaimer.Bindings();
  assert(bindings[0].Free());
  assert(!bindings[1].Free());
}

void TestVisibleOwnerKilledButHiddenSocketFails() {
  auto table = std::make_shared<FakeProcessTable>();
  table->Listen(70, 3000);
  table->ListenUnattributed(3000);

  PortReclaimer reclaimer(table, {3000});
  auto          result = reclaimer.Reclaim();

  assert(result.ports[0].killed == 1);
  assert(!table->Alive(70));
  assert(result.ports[0].outcome == PortOutcome::kFailed);
  assert(!result.AllReclaimed());
}

} // namespace

int main() {
  TestReclaimsOnlyBoundPorts();
  TestEverySharedListenerIsKilled();
  TestDeniedKillFailsThePort();
  TestOwnerGoneBeforeKillStillClears();
  TestUninspectableListenerIsNeverFree();
  TestVisibleOwnerKilledButHiddenSocketFails();

  std::cout << "stackctl_unit_port_reclaimer: pass\n";
  return 0;
}
