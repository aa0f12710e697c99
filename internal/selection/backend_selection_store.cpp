#include "backend_selection_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stackctl::selection {

namespace fs = std::filesystem;

using stackctl::runtime::config::BackendKind;
using stackctl::runtime::config::BackendSelection;

BackendSelectionStore::BackendSelectionStore(fs::path path) : path_(std::move(path)) {
}

BackendSelection BackendSelectionStore::Load() const {
  BackendSelection selection;

  std::ifstream in(path_);
  if (!in) {
    std::error_code ec;
    if (fs::exists(path_, ec)) {
      throw std::runtime_error("cannot read backend selection: " + path_.string());
    }
    selection.set_version(0);
    selection.set_active(stackctl::runtime::config::BACKEND_KIND_EMBEDDED);
    return selection;
  }

  std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &selection, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid backend selection " + path_.string() + ": " + std::string(status.message()));
  }
  if (selection.active() == stackctl::runtime::config::BACKEND_KIND_UNSPECIFIED) {
    throw std::runtime_error("backend selection names no backend: " + path_.string());
  }
  return selection;
}

BackendSelection BackendSelectionStore::Commit(std::uint64_t expected_version, BackendKind active, const std::string& updated_by,
                                               const std::string& note) {
  if (active == stackctl::runtime::config::BACKEND_KIND_UNSPECIFIED) {
    throw std::invalid_argument("backend selection requires a backend");
  }

  const auto current = Load();
  if (current.version() != expected_version) {
    throw util::VersionConflict("backend selection changed concurrently: expected version " + std::to_string(expected_version) + ", found " +
                                std::to_string(current.version()));
  }

  BackendSelection next;
  next.set_version(expected_version + 1);
  next.set_active(active);
  next.set_updated_at(util::FormatIso8601(util::Now()));
  next.set_updated_by(updated_by);
  next.set_note(note);

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(next, &json, print_options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize backend selection: " + std::string(status.message()));
  }

  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path());
  }

  const fs::path tmp_path = path_.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    out << json;
    out.flush();
    if (!out) {
      std::error_code ec;
      fs::remove(tmp_path, ec);
      throw std::runtime_error("cannot write backend selection: " + tmp_path.string());
    }
  }
  fs::rename(tmp_path, path_);

  return next;
}

} // namespace stackctl::selection
