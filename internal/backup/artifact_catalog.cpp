#include "artifact_catalog.hpp"

#include <algorithm>
#include <system_error>

namespace stackctl::backup {

namespace fs = std::filesystem;

using stackctl::model::BackendKind;
using stackctl::model::BackupArtifact;
using stackctl::runtime::config::BACKEND_KIND_EMBEDDED;
using stackctl::runtime::config::BACKEND_KIND_SERVER;

ArtifactCatalog::ArtifactCatalog(fs::path directory, std::string system_name)
    : directory_(std::move(directory)),
      system_name_(std::move(system_name)) {
}

std::string ArtifactCatalog::Prefix(BackendKind kind) const {
  return system_name_ + "_" + stackctl::model::BackendToken(kind) + "_";
}

std::string ArtifactCatalog::FileName(BackendKind kind, util::TimePoint created_at) const {
  return Prefix(kind) + util::FormatCompact(created_at) + "." + stackctl::model::BackendExtension(kind);
}

std::optional<BackupArtifact> ArtifactCatalog::Parse(const fs::path& path) const {
  const auto name = path.filename().string();

  for (auto kind : {BACKEND_KIND_EMBEDDED, BACKEND_KIND_SERVER}) {
    const auto prefix = Prefix(kind);
    const auto suffix = std::string(".") + stackctl::model::BackendExtension(kind);
    if (name.size() <= prefix.size() + suffix.size() || name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }

    auto created_at = util::ParseCompact(std::string_view(name).substr(prefix.size(), name.size() - prefix.size() - suffix.size()));
    if (!created_at) {
      return std::nullopt;
    }

    std::error_code ec;
    const auto      size = fs::file_size(path, ec);
    if (ec) {
      return std::nullopt;
    }

    BackupArtifact artifact;
    artifact.kind       = kind;
    artifact.created_at = *created_at;
    artifact.path       = path;
    artifact.size_bytes = size;
    return artifact;
  }
  return std::nullopt;
}

std::vector<BackupArtifact> ArtifactCatalog::List(BackendKind kind) const {
  std::vector<BackupArtifact> artifacts;

  std::error_code ec;
  for (fs::directory_iterator it(directory_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    auto artifact = Parse(it->path());
    if (artifact && artifact->kind == kind) {
      artifacts.push_back(std::move(*artifact));
    }
  }

  std::sort(artifacts.begin(), artifacts.end(), [](const BackupArtifact& a, const BackupArtifact& b) {
    return a.path.filename().string() < b.path.filename().string();
  });
  return artifacts;
}

std::optional<BackupArtifact> ArtifactCatalog::Latest(BackendKind kind) const {
  auto artifacts = List(kind);
  if (artifacts.empty()) {
    return std::nullopt;
  }
  return artifacts.back();
}

} // namespace stackctl::backup
