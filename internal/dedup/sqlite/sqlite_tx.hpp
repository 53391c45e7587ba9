#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace twiper::dedup::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock early
    - rolls back in the destructor unless committed
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit();

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
};

} // namespace twiper::dedup::sqlite
