#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace stackctl::selection {

/*
  Persisted BackendSelection record (protobuf JSON).

  Contract:
    - the application reads it once at startup (Load);
    - only the rollback path writes it (Commit), as a compare-and-swap
      on the version it loaded;
    - every commit bumps the version by one and replaces the file
      atomically (tmp + rename).

  A missing file is version 0 selecting the embedded backend.
*/
class BackendSelectionStore {
 public:
  explicit BackendSelectionStore(std::filesystem::path path);

  stackctl::runtime::config::BackendSelection Load() const;

  // Throws util::VersionConflict when the stored version != expected_version.
  stackctl::runtime::config::BackendSelection Commit(std::uint64_t expected_version, stackctl::runtime::config::BackendKind active,
                                                     const std::string& updated_by, const std::string& note);

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace stackctl::selection
