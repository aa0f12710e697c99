#include "backup_artifact.hpp"

namespace stackctl::model {

using stackctl::runtime::config::BACKEND_KIND_EMBEDDED;
using stackctl::runtime::config::BACKEND_KIND_SERVER;

const char* BackendName(BackendKind kind) {
  switch (kind) {
    case BACKEND_KIND_EMBEDDED:
      return "embedded";
    case BACKEND_KIND_SERVER:
      return "server";
    default:
      return "unspecified";
  }
}

const char* BackendToken(BackendKind kind) {
  switch (kind) {
    case BACKEND_KIND_EMBEDDED:
      return "sqlite";
    case BACKEND_KIND_SERVER:
      return "postgresql";
    default:
      return "unknown";
  }
}

const char* BackendExtension(BackendKind kind) {
  switch (kind) {
    case BACKEND_KIND_EMBEDDED:
      return "db";
    case BACKEND_KIND_SERVER:
      return "sql";
    default:
      return "bak";
  }
}

} // namespace stackctl::model
