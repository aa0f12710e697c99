#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "internal/model/process.hpp"
#include "internal/process/process_table.hpp"

namespace stackctl::lifecycle {

enum class LockOutcome {
  kNoFile,
  kNoHolders,
  kCleared,
  kIncomplete, // a holder could not be killed
};

struct LockReport {
  LockOutcome                              outcome = LockOutcome::kNoFile;
  std::vector<stackctl::model::LockHolder> holders;
  std::size_t                              killed        = 0;
  std::size_t                              uninspectable = 0;
};

/*
  Clears stale holders of the embedded database file.

  The embedded engine refuses writers while another process keeps the
  file (or its -wal/-shm/-journal sidecars) open with a lock, and a
  crashed worker can leave such a handle behind. Every holder is
  SIGKILLed.
*/
class LockInspector {
 public:
  LockInspector(stackctl::process::ProcessTablePtr table, std::filesystem::path database_path);

  // The database file followed by its sidecar files.
  static std::vector<std::filesystem::path> LockPaths(const std::filesystem::path& database_path);

  stackctl::process::HolderScan Inspect() const;

  LockReport Clear();

  const std::filesystem::path& database_path() const {
    return database_path_;
  }

 private:
  stackctl::process::ProcessTablePtr table_;
  std::filesystem::path              database_path_;
};

} // namespace stackctl::lifecycle
