#pragma once

#include <optional>
#include <variant>

#include "config/config.pb.h"
#include "internal/backup/artifact_catalog.hpp"
#include "internal/backup/embedded_file_backend.hpp"
#include "internal/backup/server_dump_backend.hpp"

namespace stackctl::backup {

/*
  The two backend implementations of the Backup/Restore capability
  pair. Selected by BackendKind from configuration.
*/
using Backend = std::variant<EmbeddedFileBackend, ServerDumpBackend>;

Backend MakeBackend(stackctl::model::BackendKind kind, const stackctl::runtime::config::RuntimeConfig& config);

/*
  Creates and restores BackupArtifacts.

  Creation is all-or-nothing: the backend writes "<artifact>.tmp" and
  only a complete file is renamed to the canonical name. On any failure
  the temporary file is removed and nothing appears in the catalog.
*/
class BackupManager {
 public:
  explicit BackupManager(stackctl::runtime::config::RuntimeConfig config);

  stackctl::model::BackupArtifact Create(stackctl::model::BackendKind kind);

  void Restore(const stackctl::model::BackupArtifact& artifact);

  std::optional<stackctl::model::BackupArtifact> Latest(stackctl::model::BackendKind kind) const;

  const ArtifactCatalog& catalog() const {
    return catalog_;
  }

 private:
  stackctl::runtime::config::RuntimeConfig config_;
  ArtifactCatalog                          catalog_;
};

} // namespace stackctl::backup
