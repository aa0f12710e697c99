#include "stop_sequence.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace stackctl::lifecycle {

using stackctl::model::StopState;
using stackctl::observability::IntField;
using stackctl::observability::StringField;

bool StopReport::NothingToDo() const {
  if (!located.matched.empty()) {
    return false;
  }
  for (const auto& port : ports.ports) {
    if (port.outcome != PortOutcome::kFree) {
      return false;
    }
  }
  return lock.holders.empty();
}

StopSequence::StopSequence(std::shared_ptr<ProcessLocator> locator, std::shared_ptr<PortReclaimer> reclaimer,
                           std::shared_ptr<LockInspector> inspector, std::shared_ptr<ShutdownVerifier> verifier)
    : locator_(std::move(locator)),
      reclaimer_(std::move(reclaimer)),
      inspector_(std::move(inspector)),
      verifier_(std::move(verifier)) {
}

void StopSequence::Transition(StopReport& report, StopState to) const {
  if (!stackctl::model::CanTransition(report.state, to)) {
    throw std::logic_error(std::string("illegal stop transition ") + stackctl::model::StopStateName(report.state) + " -> " +
                           stackctl::model::StopStateName(to));
  }
  STACKCTL_LOG_DEBUG("Stop sequence", {StringField("from", stackctl::model::StopStateName(report.state)),
                                       StringField("to", stackctl::model::StopStateName(to))});
  report.state = to;
}

StopReport StopSequence::Run() {
  StopReport report;

  Transition(report, StopState::kSignaling);

  STACKCTL_LOG_INFO("Stopping application processes");
  report.located = locator_->TerminateMatches();

  STACKCTL_LOG_INFO("Cleaning up application ports");
  report.ports = reclaimer_->Reclaim();

  STACKCTL_LOG_INFO("Checking database locks");
  report.lock = inspector_->Clear();

  Transition(report, StopState::kSettling);

  STACKCTL_LOG_INFO("Verifying cleanup");
  report.verify = verifier_->Verify();

  Transition(report, report.verify.Clean() ? StopState::kVerified : StopState::kPartiallyStopped);

  if (report.NothingToDo()) {
    STACKCTL_LOG_INFO("Nothing to do: no application processes, port owners or database holders found");
  }

  if (report.state == StopState::kVerified) {
    STACKCTL_LOG_SUCCESS("Cleanup complete");
  } else {
    STACKCTL_LOG_WARN("Stop pass finished with survivors; it is safe to run it again",
                      {IntField("remaining_processes", static_cast<std::int64_t>(report.verify.remaining_processes)),
                       IntField("bound_ports", static_cast<std::int64_t>(report.verify.bound_ports.size()))});
  }
  return report;
}

} // namespace stackctl::lifecycle
