#pragma once

#include <memory>

#include "internal/lifecycle/lock_inspector.hpp"
#include "internal/lifecycle/port_reclaimer.hpp"
#include "internal/lifecycle/process_locator.hpp"
#include "internal/lifecycle/shutdown_verifier.hpp"
#include "internal/model/stop_state.hpp"

namespace stackctl::lifecycle {

struct StopReport {
  stackctl::model::StopState state = stackctl::model::StopState::kRunning;

  LocateResult  located;
  ReclaimResult ports;
  LockReport    lock;
  VerifyReport  verify;

  // True when the pass found nothing to signal anywhere.
  bool NothingToDo() const;
};

/*
  One deterministic stop pass:

      Running → Signaling   SIGTERM pattern matches
                            SIGKILL port owners
                            SIGKILL database holders
              → Settling    settle interval, re-scan, probe
              → Verified | PartiallyStopped

  PartiallyStopped is a warning, never an error: the pass is idempotent
  and the operator re-runs it.
*/
class StopSequence {
 public:
  StopSequence(std::shared_ptr<ProcessLocator> locator, std::shared_ptr<PortReclaimer> reclaimer, std::shared_ptr<LockInspector> inspector,
               std::shared_ptr<ShutdownVerifier> verifier);

  StopReport Run();

 private:
  void Transition(StopReport& report, stackctl::model::StopState to) const;

  std::shared_ptr<ProcessLocator>   locator_;
  std::shared_ptr<PortReclaimer>    reclaimer_;
  std::shared_ptr<LockInspector>    inspector_;
  std::shared_ptr<ShutdownVerifier> verifier_;
};

} // namespace stackctl::lifecycle
