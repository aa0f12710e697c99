#pragma once

#include <sqlite3.h>

#include <filesystem>
#include <string>

namespace stackctl::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Never creates a database: the controller only inspects files the
  application owns.
*/
class SqliteDB {
 public:
  enum class Mode { kReadOnly, kReadWrite };

  SqliteDB(std::string path, Mode mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  // Execute a SQL string (used for pragmas)
  void Exec(const std::string& sql);

  // PRAGMA user_version, the application's schema version.
  int UserVersion();

  // First row of PRAGMA quick_check; "ok" for an intact file.
  std::string QuickCheck();

  void SetBusyTimeout(int millis);

  /*
    Takes and immediately releases a RESERVED lock.

    Returns SQLITE_OK, SQLITE_BUSY/SQLITE_LOCKED when another connection
    holds a conflicting lock, or another sqlite error code.
  */
  int TryReserve(std::string* error);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

enum class ProbeStatus {
  kAccessible,
  kMissing,
  kLocked,
  kFailed,
};

struct ProbeResult {
  ProbeStatus status = ProbeStatus::kMissing;
  std::string message;
};

/*
  Open-then-close connectivity check: open read-write, reserve, release,
  close. Zero busy timeout so a held lock is reported, not waited out.
*/
ProbeResult ProbeWritable(const std::filesystem::path& path);

const char* ProbeStatusName(ProbeStatus status);

} // namespace stackctl::db::sqlite
