#include "rollback_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stackctl::rollback {

using stackctl::db::sqlite::ProbeStatus;
using stackctl::model::BackendKind;
using stackctl::observability::IntField;
using stackctl::observability::StringField;

RollbackCoordinator::RollbackCoordinator(std::shared_ptr<stackctl::lifecycle::StopSequence>          stop,
                                         std::shared_ptr<stackctl::backup::BackupManager>            backups,
                                         std::shared_ptr<stackctl::selection::BackendSelectionStore> selection)
    : stop_(std::move(stop)),
      backups_(std::move(backups)),
      selection_(std::move(selection)) {
}

RollbackResult RollbackCoordinator::RollbackTo(BackendKind target) {
  const char* target_name = stackctl::model::BackendName(target);
  STACKCTL_LOG_INFO("Rolling back", {StringField("target", target_name)});

  RollbackResult result;

  auto artifact = backups_->Latest(target);
  if (!artifact) {
    throw util::PreconditionFailed(std::string("no ") + target_name + " backup found in " + backups_->catalog().directory().string() +
                                   "; refusing to roll back without data");
  }
  result.artifact = *artifact;
  STACKCTL_LOG_INFO("Using backup", {StringField("artifact", artifact->path.string()),
                                     IntField("size_bytes", static_cast<std::int64_t>(artifact->size_bytes))});

  const auto before = selection_->Load();

  result.stop = stop_->Run();
  if (!result.stop.ports.AllReclaimed() || !result.stop.verify.PortsFree()) {
    throw util::PreconditionFailed("application ports are still bound; not restoring over live data");
  }
  if (target == stackctl::runtime::config::BACKEND_KIND_EMBEDDED &&
      (result.stop.verify.probe.status == ProbeStatus::kLocked || result.stop.lock.outcome == stackctl::lifecycle::LockOutcome::kIncomplete)) {
    throw util::PreconditionFailed("database file is still locked; not restoring over live data");
  }
  if (!result.stop.verify.ProcessesStopped()) {
    STACKCTL_LOG_WARN("Some application processes survived the stop pass; ports and locks are clear, continuing");
  }

  backups_->Restore(result.artifact);

  result.selection = selection_->Commit(before.version(), target, "rollback-to-" + std::string(target_name),
                                        "restored " + result.artifact.path.filename().string());
  STACKCTL_LOG_SUCCESS("Backend selection updated",
                       {StringField("active", target_name), IntField("version", static_cast<std::int64_t>(result.selection.version()))});

  STACKCTL_LOG_SUCCESS("Rollback completed");
  STACKCTL_LOG_INFO("Restart the application to use the restored backend", {StringField("backend", target_name)});
  return result;
}

} // namespace stackctl::rollback
