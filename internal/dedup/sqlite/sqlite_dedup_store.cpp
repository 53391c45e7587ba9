#include "sqlite_dedup_store.hpp"

#include <filesystem>
#include <optional>

#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace twiper::dedup::sqlite {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS posted_media (
  id        INTEGER PRIMARY KEY AUTOINCREMENT,
  source    TEXT NOT NULL,
  handle    TEXT,
  name      TEXT,
  tweet_id  TEXT,
  posted_at INTEGER NOT NULL
);
CREATE UNIQUE INDEX IF NOT EXISTS idx_posted_unique
  ON posted_media (source, COALESCE(handle, ''), COALESCE(name, ''));
)sql";

std::optional<model::SourceKind> ParseSourceColumn(const std::string& value) {
  if (value == "LOCAL") return model::SourceKind::kLocal;
  if (value == "GDRIVE") return model::SourceKind::kCloudDrive;
  if (value == "OBJECT") return model::SourceKind::kAccountStorage;
  return std::nullopt;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::shared_ptr<SqliteDB> OpenAt(const std::string& path) {
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) throw util::StoreError("cannot create " + parent.string() + ": " + ec.message());
  }
  return std::make_shared<SqliteDB>(path);
}

} // namespace

SqliteDedupStore::SqliteDedupStore(const std::string& path) : SqliteDedupStore(OpenAt(path)) {
}

SqliteDedupStore::SqliteDedupStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  ApplySchema();
}

void SqliteDedupStore::ApplySchema() {
  SqliteTransaction tx(db_);
  db_->Exec(kSchema);
  tx.Commit();
}

Result SqliteDedupStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::vector<std::string> SqliteDedupStore::ListSeen() {
  Statement st(db_->Handle(), "SELECT source, handle, name FROM posted_media;");
  if (!st.Ok()) {
    throw util::StoreError(std::string("list posted media: ") + sqlite3_errmsg(db_->Handle()));
  }

  std::vector<std::string> keys;
  int                      rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.Get())) == SQLITE_ROW) {
    auto kind = ParseSourceColumn(ColText(st.Get(), 0));
    if (!kind) continue;  // rows written by other tools for unknown sources
    keys.push_back(EncodeKey(KeyMode::kFull, {*kind, ColText(st.Get(), 1), ColText(st.Get(), 2)}));
  }
  if (rc != SQLITE_DONE) {
    auto result = Translate(db_->Handle(), rc);
    throw util::StoreError("list posted media: " + result.message);
  }
  return keys;
}

Result SqliteDedupStore::RecordPosted(const PostedRecord& record) {
  try {
    SqliteTransaction tx(db_);

    Statement st(tx.Handle(),
                 "INSERT OR IGNORE INTO posted_media (source, handle, name, tweet_id, posted_at) VALUES (?,?,?,?,?);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(tx.Handle()));

    sqlite3_bind_text(st.Get(), 1, model::SourceKindName(record.key.source_kind), -1, SQLITE_STATIC);
    BindText(st.Get(), 2, record.key.handle);
    BindText(st.Get(), 3, record.key.name);
    BindText(st.Get(), 4, record.post_id);
    sqlite3_bind_int64(st.Get(), 5, static_cast<sqlite3_int64>(util::ToUnixSeconds(record.posted_at)));

    int  rc     = sqlite3_step(st.Get());
    auto result = Translate(tx.Handle(), rc);
    if (!result) return result;

    tx.Commit();
    return Result::Ok();
  } catch (const util::StoreError& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
}

std::size_t SqliteDedupStore::Count() {
  Statement st(db_->Handle(), "SELECT COUNT(*) FROM posted_media;");
  if (!st.Ok() || sqlite3_step(st.Get()) != SQLITE_ROW) {
    throw util::StoreError(std::string("count posted media: ") + sqlite3_errmsg(db_->Handle()));
  }
  return static_cast<std::size_t>(sqlite3_column_int64(st.Get(), 0));
}

} // namespace twiper::dedup::sqlite
