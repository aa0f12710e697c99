#include "backup_manager.hpp"

#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stackctl::backup {

namespace fs = std::filesystem;

using stackctl::model::BackendKind;
using stackctl::model::BackupArtifact;
using stackctl::observability::IntField;
using stackctl::observability::StringField;

Backend MakeBackend(BackendKind kind, const stackctl::runtime::config::RuntimeConfig& config) {
  switch (kind) {
    case stackctl::runtime::config::BACKEND_KIND_EMBEDDED:
      return EmbeddedFileBackend(config.embedded().path());
    case stackctl::runtime::config::BACKEND_KIND_SERVER:
      return ServerDumpBackend(config.server());
    default:
      throw std::invalid_argument("unsupported backend kind");
  }
}

BackupManager::BackupManager(stackctl::runtime::config::RuntimeConfig config)
    : config_(std::move(config)),
      catalog_(config_.backup().directory(), config_.backup().system_name()) {
}

BackupArtifact BackupManager::Create(BackendKind kind) {
  auto backend = MakeBackend(kind, config_);

  fs::create_directories(catalog_.directory());

  const auto created_at = util::Now();
  const auto final_path = catalog_.directory() / catalog_.FileName(kind, created_at);
  const auto tmp_path   = fs::path(final_path.string() + ".tmp");

  std::error_code ec;
  if (fs::exists(final_path, ec)) {
    throw util::AlreadyExists("backup artifact already exists: " + final_path.string());
  }

  const auto source = std::visit([](const auto& b) { return b.Source(); }, backend);
  STACKCTL_LOG_INFO("Creating backup",
                    {StringField("backend", stackctl::model::BackendName(kind)), StringField("source", source), StringField("path", final_path.string())});

  try {
    std::visit([&](const auto& b) { b.Backup(tmp_path); }, backend);
    fs::rename(tmp_path, final_path);
  } catch (...) {
    fs::remove(tmp_path, ec);
    throw;
  }

  BackupArtifact artifact;
  artifact.kind       = kind;
  artifact.created_at = created_at;
  artifact.source     = source;
  artifact.path       = final_path;
  artifact.size_bytes = fs::file_size(final_path);

  STACKCTL_LOG_SUCCESS("Backup created",
                       {StringField("path", artifact.path.string()), IntField("size_bytes", static_cast<std::int64_t>(artifact.size_bytes))});
  return artifact;
}

void BackupManager::Restore(const BackupArtifact& artifact) {
  auto backend = MakeBackend(artifact.kind, config_);

  STACKCTL_LOG_INFO("Restoring backup", {StringField("backend", stackctl::model::BackendName(artifact.kind)),
                                         StringField("artifact", artifact.path.string())});
  std::visit([&](const auto& b) { b.Restore(artifact); }, backend);
  STACKCTL_LOG_SUCCESS("Backup restored", {StringField("artifact", artifact.path.string())});
}

std::optional<BackupArtifact> BackupManager::Latest(BackendKind kind) const {
  return catalog_.Latest(kind);
}

} // namespace stackctl::backup
