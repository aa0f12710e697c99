#include "lock_inspector.hpp"

#include <signal.h>

#include <system_error>

#include "internal/observability/logging.hpp"

namespace stackctl::lifecycle {

using stackctl::observability::IntField;
using stackctl::observability::StringField;
using stackctl::process::SignalResult;

LockInspector::LockInspector(stackctl::process::ProcessTablePtr table, std::filesystem::path database_path)
    : table_(std::move(table)),
      database_path_(std::move(database_path)) {
}

std::vector<std::filesystem::path> LockInspector::LockPaths(const std::filesystem::path& database_path) {
  const auto base = database_path.string();
  return {database_path, base + "-wal", base + "-shm", base + "-journal"};
}

stackctl::process::HolderScan LockInspector::Inspect() const {
  return table_->HoldersOf(LockPaths(database_path_));
}

LockReport LockInspector::Clear() {
  LockReport report;

  std::error_code ec;
  if (!std::filesystem::exists(database_path_, ec)) {
    STACKCTL_LOG_INFO("Database file not present, no lock to clear", {StringField("path", database_path_.string())});
    return report;
  }

  auto scan            = Inspect();
  report.holders       = std::move(scan.holders);
  report.uninspectable = scan.uninspectable;

  if (report.uninspectable > 0) {
    STACKCTL_LOG_WARN("Some processes could not be inspected for database handles; re-run with elevated privilege to see them",
                      {IntField("uninspectable", static_cast<std::int64_t>(report.uninspectable))});
  }

  if (report.holders.empty()) {
    report.outcome = LockOutcome::kNoHolders;
    STACKCTL_LOG_SUCCESS("No database locks found", {StringField("path", database_path_.string())});
    return report;
  }

  STACKCTL_LOG_WARN("Database file is held open, clearing",
                    {StringField("path", database_path_.string()), IntField("holders", static_cast<std::int64_t>(report.holders.size()))});
  for (const auto& holder : report.holders) {
    STACKCTL_LOG_DEBUG("Lock holder", {IntField("pid", holder.process.pid), IntField("files", static_cast<std::int64_t>(holder.paths.size())),
                                       StringField("command", holder.process.command_line)});
  }

  report.outcome = LockOutcome::kCleared;
  for (const auto& holder : report.holders) {
    switch (table_->Signal(holder.process.pid, SIGKILL)) {
      case SignalResult::kDelivered:
        ++report.killed;
        break;
      case SignalResult::kGone:
        STACKCTL_LOG_WARN("Lock holder exited before it could be killed", {IntField("pid", holder.process.pid)});
        break;
      case SignalResult::kDenied:
        report.outcome = LockOutcome::kIncomplete;
        STACKCTL_LOG_WARN("Not permitted to kill lock holder",
                          {IntField("pid", holder.process.pid), StringField("command", holder.process.command_line)});
        break;
    }
  }

  if (report.outcome == LockOutcome::kCleared) {
    STACKCTL_LOG_SUCCESS("Database locks cleared", {IntField("killed", static_cast<std::int64_t>(report.killed))});
  } else {
    STACKCTL_LOG_WARN("Could not clear all database locks");
  }
  return report;
}

} // namespace stackctl::lifecycle
