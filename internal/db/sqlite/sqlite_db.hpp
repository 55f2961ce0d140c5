#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace strata::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction of a repository; the
  connection mutex serializes them (SQLite allows one open transaction
  per connection).
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

  std::mutex& Mutex() {
    return mutex_;
  }

  // Runs one or more statements; throws with the sqlite message on error.
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

/*
  Prepared statement owned for the scope of one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  int Step() {
    return sqlite3_step(stmt_);
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace strata::db::sqlite
