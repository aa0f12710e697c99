#include "sqlite_db.hpp"

#include <stdexcept>
#include <system_error>

namespace stackctl::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, Mode mode) : path_(std::move(path)) {
  const int flags = (mode == Mode::kReadOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE) | SQLITE_OPEN_FULLMUTEX;
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(path_ + ": " + msg);
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr), db_, "sqlite prepare");

  int rc      = sqlite3_step(stmt);
  int version = 0;
  if (rc == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite user_version: ") + sqlite3_errmsg(db_));
  }
  return version;
}

std::string SqliteDB::QuickCheck() {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA quick_check;", -1, &stmt, nullptr), db_, "sqlite prepare");

  int         rc = sqlite3_step(stmt);
  std::string result;
  if (rc == SQLITE_ROW) {
    const auto* text = sqlite3_column_text(stmt, 0);
    result           = text ? reinterpret_cast<const char*>(text) : "";
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite quick_check: ") + sqlite3_errmsg(db_));
  }
  return result;
}

void SqliteDB::SetBusyTimeout(int millis) {
  ThrowIf(sqlite3_busy_timeout(db_, millis), db_, "busy_timeout");
}

int SqliteDB::TryReserve(std::string* error) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    if (error) *error = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    return rc;
  }

  rc = sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err);
  if (rc != SQLITE_OK && error) {
    *error = err ? err : sqlite3_errstr(rc);
  }
  sqlite3_free(err);
  return rc;
}

ProbeResult ProbeWritable(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return {ProbeStatus::kMissing, {}};
  }

  try {
    SqliteDB db(path.string(), SqliteDB::Mode::kReadWrite);
    db.SetBusyTimeout(0);

    std::string error;
    const int   rc = db.TryReserve(&error);
    if (rc == SQLITE_OK) {
      return {ProbeStatus::kAccessible, {}};
    }
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      return {ProbeStatus::kLocked, error};
    }
    return {ProbeStatus::kFailed, error};
  } catch (const std::exception& e) {
    return {ProbeStatus::kFailed, e.what()};
  }
}

const char* ProbeStatusName(ProbeStatus status) {
  switch (status) {
    case ProbeStatus::kAccessible:
      return "accessible";
    case ProbeStatus::kMissing:
      return "missing";
    case ProbeStatus::kLocked:
      return "locked";
    case ProbeStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace stackctl::db::sqlite
