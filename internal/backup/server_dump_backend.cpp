#include "server_dump_backend.hpp"

#include <system_error>
#include <vector>

#include "internal/db/postgres/pg_probe.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/subprocess.hpp"
#include "internal/util/errors.hpp"

namespace stackctl::backup {

namespace fs = std::filesystem;

using stackctl::observability::StringField;

ServerDumpBackend::ServerDumpBackend(stackctl::runtime::config::ServerBackendConfig config) : config_(std::move(config)) {
}

std::string ServerDumpBackend::Source() const {
  return config_.host() + ":" + std::to_string(config_.port()) + "/" + config_.database();
}

std::vector<std::string> ServerDumpBackend::ConnectionArgs() const {
  std::vector<std::string> args = {"-h", config_.host(), "-p", std::to_string(config_.port())};
  if (!config_.user().empty()) {
    args.insert(args.end(), {"-U", config_.user()});
  }
  args.insert(args.end(), {"-d", config_.database(), "--no-password"});
  return args;
}

void ServerDumpBackend::Backup(const fs::path& destination) const {
  if (config_.database().empty()) {
    throw util::PreconditionFailed("server.database is not configured (set PGDATABASE)");
  }

  if (config_.verify_connection()) {
    try {
      auto version = stackctl::db::postgres::ServerVersion(config_);
      STACKCTL_LOG_INFO("Connected to server backend", {StringField("source", Source()), StringField("server_version", version)});
    } catch (const std::exception& e) {
      throw util::ExportFailed("cannot connect to " + Source() + ": " + e.what());
    }
  }

  std::vector<std::string> argv = {config_.pg_dump_path()};
  auto                     connection = ConnectionArgs();
  argv.insert(argv.end(), connection.begin(), connection.end());
  argv.insert(argv.end(), {"--clean", "--if-exists", "-f", destination.string()});

  STACKCTL_LOG_INFO("Running logical export", {StringField("tool", config_.pg_dump_path()), StringField("source", Source())});
  auto status = stackctl::process::RunProcess(argv);
  if (!status.Success()) {
    throw util::ExportFailed(config_.pg_dump_path() + " " + status.Describe());
  }

  std::error_code ec;
  if (!fs::exists(destination, ec) || fs::file_size(destination, ec) == 0 || ec) {
    throw util::ExportFailed(config_.pg_dump_path() + " produced no output");
  }
}

void ServerDumpBackend::Restore(const stackctl::model::BackupArtifact& artifact) const {
  std::error_code ec;
  if (!fs::is_regular_file(artifact.path, ec)) {
    throw util::PreconditionFailed("backup artifact not found: " + artifact.path.string());
  }
  if (config_.database().empty()) {
    throw util::PreconditionFailed("server.database is not configured (set PGDATABASE)");
  }

  std::vector<std::string> argv = {config_.psql_path()};
  auto                     connection = ConnectionArgs();
  argv.insert(argv.end(), connection.begin(), connection.end());
  argv.insert(argv.end(), {"-q", "-v", "ON_ERROR_STOP=1", "-f", artifact.path.string()});

  STACKCTL_LOG_INFO("Replaying logical dump", {StringField("tool", config_.psql_path()), StringField("artifact", artifact.path.string())});
  auto status = stackctl::process::RunProcess(argv);
  if (!status.Success()) {
    throw util::RestoreFailed(config_.psql_path() + " " + status.Describe());
  }
}

} // namespace stackctl::backup
