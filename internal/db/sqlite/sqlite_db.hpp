#pragma once

#include <sqlite3.h>

#include <string>

namespace dedup::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace dedup::db::sqlite
