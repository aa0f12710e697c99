#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/backup_artifact.hpp"

namespace stackctl::backup {

/*
  Backup/restore for the server backend through its logical dump tools
  (pg_dump / psql). Output is plain SQL written with --clean --if-exists,
  so replaying it replaces the objects of a database that still has the
  schema.
*/
class ServerDumpBackend {
 public:
  static constexpr stackctl::model::BackendKind kKind = stackctl::runtime::config::BACKEND_KIND_SERVER;

  explicit ServerDumpBackend(stackctl::runtime::config::ServerBackendConfig config);

  // host:port/database
  std::string Source() const;

  // Throws util::ExportFailed; |destination| may hold partial output afterwards.
  void Backup(const std::filesystem::path& destination) const;

  // Throws util::RestoreFailed.
  void Restore(const stackctl::model::BackupArtifact& artifact) const;

 private:
  std::vector<std::string> ConnectionArgs() const;

  stackctl::runtime::config::ServerBackendConfig config_;
};

} // namespace stackctl::backup
