#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/dedup/dedup_store.hpp"
#include "sqlite_db.hpp"

namespace twiper::dedup::sqlite {

/*
  Relational dedup store.

  Schema:

      posted_media(id, source, handle, name, tweet_id, posted_at)
      UNIQUE (source, COALESCE(handle,''), COALESCE(name,''))

  Inserts use INSERT OR IGNORE, so recording a key twice is a no-op.
*/
class SqliteDedupStore final : public DedupStore {
 public:
  // Opens (creating if needed) the database and applies the schema. Throws StoreError.
  explicit SqliteDedupStore(const std::string& path);
  explicit SqliteDedupStore(std::shared_ptr<SqliteDB> db);

  KeyMode Mode() const override {
    return KeyMode::kFull;
  }

  std::vector<std::string> ListSeen() override;

  Result RecordPosted(const PostedRecord& record) override;

  // Number of rows.
  std::size_t Count();

 private:
  void ApplySchema();

  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace twiper::dedup::sqlite
