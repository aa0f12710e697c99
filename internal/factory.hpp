#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/backup/backup_manager.hpp"
#include "internal/lifecycle/stop_sequence.hpp"
#include "internal/process/process_table.hpp"
#include "internal/rollback/rollback_coordinator.hpp"
#include "internal/selection/backend_selection_store.hpp"

namespace stackctl::factory {

/*
  Application

  Every component a command needs, wired from one RuntimeConfig.
  Lives for the duration of a single command invocation.
*/
struct Application {
  stackctl::process::ProcessTablePtr process_table;

  std::shared_ptr<lifecycle::ProcessLocator>   locator;
  std::shared_ptr<lifecycle::PortReclaimer>    reclaimer;
  std::shared_ptr<lifecycle::LockInspector>    lock_inspector;
  std::shared_ptr<lifecycle::ShutdownVerifier> verifier;
  std::shared_ptr<lifecycle::StopSequence>     stop_sequence;

  std::shared_ptr<backup::BackupManager>            backups;
  std::shared_ptr<selection::BackendSelectionStore> selection;
  std::shared_ptr<rollback::RollbackCoordinator>    rollback;
};

/*
  Build

  Composition root. The only place that knows the concrete
  ProcessTable; pass one explicitly to substitute it.
*/
Application Build(const stackctl::runtime::config::RuntimeConfig& config, stackctl::process::ProcessTablePtr process_table = nullptr);

} // namespace stackctl::factory
