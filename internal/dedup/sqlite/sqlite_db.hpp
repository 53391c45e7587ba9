#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace twiper::dedup::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opening fails with StoreError; the dedup store must be readable before a
  run starts.
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

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

 private:
  // journal mode, full synchronous flush, busy timeout
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  RAII prepared statement; finalized on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  bool Ok() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace twiper::dedup::sqlite
