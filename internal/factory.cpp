#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

#include "internal/process/procfs_process_table.hpp"

namespace stackctl::factory {

using namespace stackctl;

Application Build(const stackctl::runtime::config::RuntimeConfig& config, stackctl::process::ProcessTablePtr process_table) {
  Application app;

  // ------------------------------------------------------------------
  // Process view
  // ------------------------------------------------------------------
  app.process_table = process_table ? std::move(process_table) : std::make_shared<process::ProcfsProcessTable>();

  // ------------------------------------------------------------------
  // Stop path
  // ------------------------------------------------------------------
  std::vector<stackctl::runtime::config::ProcessPattern> patterns(config.stop().patterns().begin(), config.stop().patterns().end());

  std::vector<std::uint16_t> ports;
  for (auto port : config.stop().ports()) {
    ports.push_back(static_cast<std::uint16_t>(port));
  }

  app.locator        = std::make_shared<lifecycle::ProcessLocator>(app.process_table, std::move(patterns));
  app.reclaimer      = std::make_shared<lifecycle::PortReclaimer>(app.process_table, std::move(ports));
  app.lock_inspector = std::make_shared<lifecycle::LockInspector>(app.process_table, config.embedded().path());
  app.verifier       = std::make_shared<lifecycle::ShutdownVerifier>(app.locator, app.reclaimer, config.embedded().path(),
                                                                     std::chrono::milliseconds(config.stop().settle_interval_ms()));
  app.stop_sequence  = std::make_shared<lifecycle::StopSequence>(app.locator, app.reclaimer, app.lock_inspector, app.verifier);

  // ------------------------------------------------------------------
  // Backup / rollback
  // ------------------------------------------------------------------
  app.backups   = std::make_shared<backup::BackupManager>(config);
  app.selection = std::make_shared<selection::BackendSelectionStore>(config.selection().path());
  app.rollback  = std::make_shared<rollback::RollbackCoordinator>(app.stop_sequence, app.backups, app.selection);

  return app;
}

} // namespace stackctl::factory
