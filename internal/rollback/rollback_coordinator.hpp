#pragma once

#include <memory>
#include <string>

#include "internal/backup/backup_manager.hpp"
#include "internal/lifecycle/stop_sequence.hpp"
#include "internal/selection/backend_selection_store.hpp"

namespace stackctl::rollback {

struct RollbackResult {
  stackctl::model::BackupArtifact             artifact;
  stackctl::lifecycle::StopReport             stop;
  stackctl::runtime::config::BackendSelection selection;
};

/*
  Switches the application back to a backend from its latest backup.

    1. locate latest artifact for the target   (none → PreconditionFailed)
    2. stop the stack                          (StopSequence)
    3. require ports reclaimed and, for the embedded target, the
       database file unlocked                  (else PreconditionFailed)
    4. restore the artifact over live data
    5. commit BackendSelection (CAS on the version read first)

  Nothing is touched before step 1 succeeds. Restarting the application
  is left to the operator.
*/
class RollbackCoordinator {
 public:
  RollbackCoordinator(std::shared_ptr<stackctl::lifecycle::StopSequence> stop, std::shared_ptr<stackctl::backup::BackupManager> backups,
                      std::shared_ptr<stackctl::selection::BackendSelectionStore> selection);

  RollbackResult RollbackTo(stackctl::model::BackendKind target);

 private:
  std::shared_ptr<stackctl::lifecycle::StopSequence>          stop_;
  std::shared_ptr<stackctl::backup::BackupManager>            backups_;
  std::shared_ptr<stackctl::selection::BackendSelectionStore> selection_;
};

} // namespace stackctl::rollback
