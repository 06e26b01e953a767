#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

namespace artifact::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

bool IsInMemoryPath(const std::string& path) {
  return path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite " + what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (!IsInMemoryPath(path_)) {
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw std::runtime_error("sqlite database directory " + parent.string() + ": " + ec.message());
      }
    }
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite exec '" + sql + "': " + (err ? err : sqlite3_errstr(rc));
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "prepare '" + sql + "'");
  return stmt;
}

void SqliteDB::Configure() {
  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");

  // a completed job implies its version survived a crash
  Exec("PRAGMA synchronous=FULL;");

  if (!IsInMemoryPath(path_)) {
    Exec("PRAGMA journal_mode=WAL;");
  }
}

} // namespace artifact::db::sqlite
