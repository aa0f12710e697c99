#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/backup_artifact.hpp"

namespace stackctl::backup {

/*
  Naming and discovery of backup artifacts in one directory.

      <system>_<backend>_<YYYYMMDD_HHMMSS>.<ext>

  The timestamp is UTC, so the lexically greatest name is the most
  recent artifact; modification times are never consulted. Files that
  do not follow the convention (including in-flight ".tmp" files) are
  ignored.
*/
class ArtifactCatalog {
 public:
  ArtifactCatalog(std::filesystem::path directory, std::string system_name);

  std::string FileName(stackctl::model::BackendKind kind, util::TimePoint created_at) const;

  std::optional<stackctl::model::BackupArtifact> Parse(const std::filesystem::path& path) const;

  // Ascending by name. A missing directory yields an empty list.
  std::vector<stackctl::model::BackupArtifact> List(stackctl::model::BackendKind kind) const;

  std::optional<stackctl::model::BackupArtifact> Latest(stackctl::model::BackendKind kind) const;

  const std::filesystem::path& directory() const {
    return directory_;
  }

 private:
  std::string Prefix(stackctl::model::BackendKind kind) const;

  std::filesystem::path directory_;
  std::string           system_name_;
};

} // namespace stackctl::backup
