#include "internal/selection/backend_selection_store.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "support/temp_dir.hpp"

namespace {

using stackctl::runtime::config::BACKEND_KIND_EMBEDDED;
using stackctl::runtime::config::BACKEND_KIND_SERVER;
using stackctl::selection::BackendSelectionStore;

void TestMissingRecordDefaultsToEmbedded() {
  const auto            dir = stackctl::testing::MakeTempDir("selection_default");
  BackendSelectionStore store(dir / "backend_selection.json");

  auto selection = store.Load();
  assert(selection.version() == 0);
  assert(selection.active() == BACKEND_KIND_EMBEDDED);
}

void TestCommitBumpsVersionAndPersists() {
  const auto            dir = stackctl::testing::MakeTempDir("selection_commit");
  BackendSelectionStore store(dir / "state" / "backend_selection.json");

  auto first = store.Commit(0, BACKEND_KIND_SERVER, "migration", "cut over");
  assert(first.version() == 1);
  assert(first.active() == BACKEND_KIND_SERVER);
  assert(!first.updated_at().empty());

  BackendSelectionStore reopened(dir / "state" / "backend_selection.json");
  auto                  loaded = reopened.Load();
  assert(loaded.version() == 1);
  assert(loaded.active() == BACKEND_KIND_SERVER);
  assert(loaded.updated_by() == "migration");

  auto second = reopened.Commit(1, BACKEND_KIND_EMBEDDED, "rollback-to-embedded", "restored");
  assert(second.version() == 2);
  assert(store.Load().active() == BACKEND_KIND_EMBEDDED);
  assert(!std::filesystem::exists(dir / "state" / "backend_selection.json.tmp"));
}

void TestStaleVersionIsRejected() {
  const auto            dir = stackctl::testing::MakeTempDir("selection_conflict");
  BackendSelectionStore store(dir / "backend_selection.json");
  store.Commit(0, BACKEND_KIND_SERVER, "a", "");

  bool threw = false;
  try {
    store.Commit(0, BACKEND_KIND_EMBEDDED, "b", "");
  } catch (const stackctl::util::VersionConflict&) {
    threw = true;
  }
  assert(threw);
  assert(store.Load().active() == BACKEND_KIND_SERVER);
  assert(store.Load().version() == 1);
}

void TestCorruptRecordIsAnError() {
  const auto dir = stackctl::testing::MakeTempDir("selection_corrupt");
  stackctl::testing::WriteFile(dir / "backend_selection.json", "{\"active\": \"BACKEND_KIND_SERVER\", \"bogus\": 1}");

  BackendSelectionStore store(dir / "backend_selection.json");
  bool                  threw = false;
  try {
    store.Load();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMissingRecordDefaultsToEmbedded();
  TestCommitBumpsVersionAndPersists();
  TestStaleVersionIsRejected();
  TestCorruptRecordIsAnError();

  std::cout << "stackctl_unit_backend_selection_store: pass\n";
  return 0;
}
