#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/lifecycle/port_reclaimer.hpp"
#include "internal/lifecycle/process_locator.hpp"

namespace stackctl::lifecycle {

struct VerifyReport {
  std::size_t                            remaining_processes = 0;
  std::vector<std::uint16_t>             bound_ports;
  stackctl::db::sqlite::ProbeResult      probe;

  bool ProcessesStopped() const {
    return remaining_processes == 0;
  }

  bool PortsFree() const {
    return bound_ports.empty();
  }

  bool DatabaseUnlocked() const {
    return probe.status != stackctl::db::sqlite::ProbeStatus::kLocked;
  }

  bool Clean() const {
    return ProcessesStopped() && PortsFree() && DatabaseUnlocked();
  }
};

/*
  Second look after the signaling passes.

  Waits the settle interval, then re-scans (without signaling) and
  probes the database. Processes still running and a database that is
  still locked are reported separately: the lock can outlive its owner
  on some filesystems.
*/
class ShutdownVerifier {
 public:
  ShutdownVerifier(std::shared_ptr<ProcessLocator> locator, std::shared_ptr<PortReclaimer> reclaimer, std::filesystem::path database_path,
                   std::chrono::milliseconds settle_interval);

  VerifyReport Verify() const;

  std::chrono::milliseconds settle_interval() const {
    return settle_interval_;
  }

 private:
  std::shared_ptr<ProcessLocator> locator_;
  std::shared_ptr<PortReclaimer>  reclaimer_;
  std::filesystem::path           database_path_;
  std::chrono::milliseconds       settle_interval_;
};

} // namespace stackctl::lifecycle
