#include "embedded_file_backend.hpp"

#include <system_error>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stackctl::backup {

namespace fs = std::filesystem;

using stackctl::db::sqlite::SqliteDB;
using stackctl::observability::IntField;
using stackctl::observability::StringField;

namespace {

int ReadUserVersion(const fs::path& path) {
  SqliteDB db(path.string(), SqliteDB::Mode::kReadOnly);
  return db.UserVersion();
}

// An artifact must be a non-empty, intact database before it may replace the live file.
void RequireRestorable(const fs::path& path) {
  std::error_code ec;
  const auto      size = fs::file_size(path, ec);
  if (ec || size == 0) {
    throw util::PreconditionFailed("backup artifact is empty: " + path.string());
  }

  std::string check;
  try {
    SqliteDB db(path.string(), SqliteDB::Mode::kReadOnly);
    check = db.QuickCheck();
  } catch (const std::exception& e) {
    throw util::PreconditionFailed("backup artifact is not a readable database: " + path.string() + ": " + e.what());
  }
  if (check != "ok") {
    throw util::PreconditionFailed("backup artifact failed integrity check: " + path.string() + ": " + check);
  }
}

} // namespace

EmbeddedFileBackend::EmbeddedFileBackend(fs::path database_path) : database_path_(std::move(database_path)) {
}

void EmbeddedFileBackend::Backup(const fs::path& destination) const {
  std::error_code ec;
  if (!fs::is_regular_file(database_path_, ec)) {
    throw util::PreconditionFailed("database file not found, nothing to back up: " + database_path_.string());
  }

  const fs::path wal = database_path_.string() + "-wal";
  if (fs::exists(wal, ec) && fs::file_size(wal, ec) > 0) {
    STACKCTL_LOG_WARN("Write-ahead log is not empty; changes not yet checkpointed are not part of this backup",
                      {StringField("wal", wal.string())});
  }

  fs::copy_file(database_path_, destination, fs::copy_options::overwrite_existing);
}

void EmbeddedFileBackend::CheckSchemaCompatible(const stackctl::model::BackupArtifact& artifact) const {
  std::error_code ec;
  if (!fs::exists(database_path_, ec)) {
    return;
  }

  int live_version     = 0;
  int artifact_version = 0;
  try {
    live_version     = ReadUserVersion(database_path_);
    artifact_version = ReadUserVersion(artifact.path);
  } catch (const std::exception& e) {
    STACKCTL_LOG_WARN("Schema versions could not be compared", {StringField("error", e.what())});
    return;
  }

  if (artifact_version < live_version) {
    throw util::Unsupported("restoring an artifact with an older schema is unsupported: artifact user_version=" +
                            std::to_string(artifact_version) + ", live user_version=" + std::to_string(live_version));
  }
  STACKCTL_LOG_DEBUG("Schema versions compatible", {IntField("artifact", artifact_version), IntField("live", live_version)});
}

void EmbeddedFileBackend::Restore(const stackctl::model::BackupArtifact& artifact) const {
  std::error_code ec;
  if (!fs::is_regular_file(artifact.path, ec)) {
    throw util::PreconditionFailed("backup artifact not found: " + artifact.path.string());
  }

  RequireRestorable(artifact.path);
  CheckSchemaCompatible(artifact);

  if (database_path_.has_parent_path()) {
    fs::create_directories(database_path_.parent_path());
  }

  const fs::path tmp_path = database_path_.string() + ".restore.tmp";
  try {
    fs::copy_file(artifact.path, tmp_path, fs::copy_options::overwrite_existing);
  } catch (...) {
    fs::remove(tmp_path, ec);
    throw;
  }

  // A leftover WAL would be replayed into the restored file.
  for (const char* suffix : {"-wal", "-shm", "-journal"}) {
    fs::remove(database_path_.string() + suffix);
  }

  fs::rename(tmp_path, database_path_);
}

} // namespace stackctl::backup
