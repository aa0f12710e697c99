#pragma once

#include <filesystem>
#include <string>

#include "internal/model/backup_artifact.hpp"

namespace stackctl::backup {

/*
  Backup/restore for the single-file embedded database.

  Backup is a plain file copy, so the stack should be stopped first:
  changes still sitting in the -wal sidecar are not part of the copy.
*/
class EmbeddedFileBackend {
 public:
  static constexpr stackctl::model::BackendKind kKind = stackctl::runtime::config::BACKEND_KIND_EMBEDDED;

  explicit EmbeddedFileBackend(std::filesystem::path database_path);

  std::string Source() const {
    return database_path_.string();
  }

  // Throws util::PreconditionFailed when the database file is missing.
  void Backup(const std::filesystem::path& destination) const;

  /*
    Replaces the live file with the artifact: copy beside the live file,
    drop stale sidecars, rename over. Throws util::PreconditionFailed when
    the artifact is empty or fails PRAGMA quick_check, and
    util::Unsupported when it carries an older schema version than the
    live file. The live file is untouched in both cases.
  */
  void Restore(const stackctl::model::BackupArtifact& artifact) const;

  // Compares PRAGMA user_version of artifact and live file.
  void CheckSchemaCompatible(const stackctl::model::BackupArtifact& artifact) const;

 private:
  std::filesystem::path database_path_;
};

} // namespace stackctl::backup
