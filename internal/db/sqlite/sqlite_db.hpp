#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace artifact::db::sqlite {

/*
  Thin RAII wrapper around one shared sqlite3* connection to the version
  database. The parent directory of a file path is created on open.

  SQLite nests no transactions on a connection, so every transaction holds
  the connection lock from BEGIN until COMMIT/ROLLBACK.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // pragmas and schema statements; throws std::runtime_error
  void Exec(const std::string& sql);

  // caller finalizes
  sqlite3_stmt* Prepare(const std::string& sql);

  std::unique_lock<std::mutex> LockConnection() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace artifact::db::sqlite
