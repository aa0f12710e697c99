#include "port_reclaimer.hpp"

#include <signal.h>

#include "internal/observability/logging.hpp"

namespace stackctl::lifecycle {

using stackctl::observability::IntField;
using stackctl::observability::StringField;
using stackctl::process::SignalResult;

bool ReclaimResult::AllReclaimed() const {
  for (const auto& report : ports) {
    if (report.outcome == PortOutcome::kFailed) {
      return false;
    }
  }
  return true;
}

PortReclaimer::PortReclaimer(stackctl::process::ProcessTablePtr table, std::vector<std::uint16_t> ports)
    : table_(std::move(table)),
      ports_(std::move(ports)) {
}

std::vector<stackctl::model::PortBinding> PortReclaimer::Bindings() const {
  std::vector<stackctl::model::PortBinding> bindings;
  bindings.reserve(ports_.size());
  for (auto port : ports_) {
    stackctl::model::PortBinding binding;
    auto scan            = table_->ListenersOn(port);
    binding.port         = port;
    binding.owners       = std::move(scan.owners);
    binding.unattributed = scan.unattributed;
    bindings.push_back(std::move(binding));
  }
  return bindings;
}

ReclaimResult PortReclaimer::Reclaim() {
  ReclaimResult result;

  for (auto& binding : Bindings()) {
    if (binding.Free()) {
      STACKCTL_LOG_INFO("Port is already free", {IntField("port", binding.port)});
      PortReport report;
      report.port = binding.port;
      result.ports.push_back(std::move(report));
      continue;
    }

    PortReport report;
    report.port         = binding.port;
    report.owners       = std::move(binding.owners);
    report.unattributed = binding.unattributed;

    report.outcome = PortOutcome::kCleared;
    for (const auto& owner : report.owners) {
      STACKCTL_LOG_INFO("Killing process on port", {IntField("port", report.port), IntField("pid", owner.pid)});
      switch (table_->Signal(owner.pid, SIGKILL)) {
        case SignalResult::kDelivered:
          ++report.killed;
          break;
        case SignalResult::kGone:
          STACKCTL_LOG_WARN("Port owner exited before it could be killed", {IntField("pid", owner.pid)});
          break;
        case SignalResult::kDenied:
          report.outcome = PortOutcome::kFailed;
          STACKCTL_LOG_WARN("Not permitted to kill port owner",
                            {IntField("port", report.port), IntField("pid", owner.pid), StringField("command", owner.command_line)});
          break;
      }
    }

    if (report.unattributed > 0) {
      report.outcome = PortOutcome::kFailed;
      STACKCTL_LOG_WARN("Port is bound by a process that could not be inspected; re-run with elevated privilege",
                        {IntField("port", report.port), IntField("sockets", static_cast<std::int64_t>(report.unattributed))});
    }

    if (report.outcome == PortOutcome::kCleared) {
      STACKCTL_LOG_SUCCESS("Port cleared", {IntField("port", report.port)});
    } else {
      STACKCTL_LOG_WARN("Could not clear port", {IntField("port", report.port)});
    }
    result.killed += report.killed;
    result.ports.push_back(std::move(report));
  }

  return result;
}

} // namespace stackctl::lifecycle
