#include "shutdown_verifier.hpp"

#include <thread>

#include "internal/observability/logging.hpp"

namespace stackctl::lifecycle {

using stackctl::db::sqlite::ProbeStatus;
using stackctl::observability::BoolField;
using stackctl::observability::IntField;
using stackctl::observability::StringField;

ShutdownVerifier::ShutdownVerifier(std::shared_ptr<ProcessLocator> locator, std::shared_ptr<PortReclaimer> reclaimer,
                                   std::filesystem::path database_path, std::chrono::milliseconds settle_interval)
    : locator_(std::move(locator)),
      reclaimer_(std::move(reclaimer)),
      database_path_(std::move(database_path)),
      settle_interval_(settle_interval) {
}

VerifyReport ShutdownVerifier::Verify() const {
  if (settle_interval_.count() > 0) {
    STACKCTL_LOG_INFO("Waiting for processes to terminate", {IntField("settle_ms", settle_interval_.count())});
    std::this_thread::sleep_for(settle_interval_);
  }

  VerifyReport report;
  report.remaining_processes = locator_->Scan().size();
  for (const auto& binding : reclaimer_->Bindings()) {
    if (!binding.Free()) {
      report.bound_ports.push_back(binding.port);
    }
  }
  report.probe = stackctl::db::sqlite::ProbeWritable(database_path_);

  STACKCTL_LOG_DEBUG("Verification scan", {BoolField("processes_stopped", report.ProcessesStopped()), BoolField("ports_free", report.PortsFree()),
                                           StringField("database", stackctl::db::sqlite::ProbeStatusName(report.probe.status))});

  if (report.ProcessesStopped()) {
    STACKCTL_LOG_SUCCESS("All processes stopped");
  } else {
    STACKCTL_LOG_WARN("Processes may still be running", {IntField("count", static_cast<std::int64_t>(report.remaining_processes))});
  }

  for (auto port : report.bound_ports) {
    STACKCTL_LOG_WARN("Port is still bound", {IntField("port", port)});
  }

  switch (report.probe.status) {
    case ProbeStatus::kAccessible:
      STACKCTL_LOG_SUCCESS("Database is accessible (no locks)", {StringField("path", database_path_.string())});
      break;
    case ProbeStatus::kMissing:
      STACKCTL_LOG_INFO("Database file not present, nothing to probe", {StringField("path", database_path_.string())});
      break;
    case ProbeStatus::kLocked:
      STACKCTL_LOG_ERROR("Database may still be locked", {StringField("path", database_path_.string()), StringField("error", report.probe.message)});
      break;
    case ProbeStatus::kFailed:
      STACKCTL_LOG_WARN("Database probe failed", {StringField("path", database_path_.string()), StringField("error", report.probe.message)});
      break;
  }

  return report;
}

} // namespace stackctl::lifecycle
