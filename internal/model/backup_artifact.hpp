#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace stackctl::model {

using BackendKind = stackctl::runtime::config::BackendKind;

/*
  An immutable, complete backup file plus the metadata derived from its
  name and size. Only fully written artifacts are ever represented;
  temporary files never become BackupArtifacts.
*/
struct BackupArtifact {
  BackendKind           kind = stackctl::runtime::config::BACKEND_KIND_UNSPECIFIED;
  util::TimePoint       created_at;
  std::string           source;
  std::filesystem::path path;
  std::uint64_t         size_bytes = 0;
};

const char* BackendName(BackendKind kind);

// Token used in artifact file names ("sqlite", "postgresql").
const char* BackendToken(BackendKind kind);

// File extension without the dot ("db", "sql").
const char* BackendExtension(BackendKind kind);

} // namespace stackctl::model
