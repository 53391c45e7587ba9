#include <cassert>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/dedup/json/json_dedup_store.hpp"
#include "internal/dedup/sqlite/sqlite_dedup_store.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using twiper::dedup::DedupKey;
using twiper::dedup::EncodeKey;
using twiper::dedup::KeyMode;
using twiper::dedup::PostedRecord;
using twiper::dedup::json::JsonDedupStore;
using twiper::dedup::sqlite::SqliteDedupStore;
using twiper::model::SourceKind;

PostedRecord Record(SourceKind kind, const std::string& handle, const std::string& name, const std::string& post_id = "1") {
  PostedRecord record;
  record.key       = {kind, handle, name};
  record.post_id   = post_id;
  record.posted_at = twiper::util::FromUnixSeconds(1'700'000'000);
  return record;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool Contains(const std::vector<std::string>& keys, const std::string& key) {
  for (const auto& k : keys) {
    if (k == key) return true;
  }
  return false;
}

void TestKeyEncoding() {
  DedupKey key{SourceKind::kCloudDrive, "1AbC", "clip.mp4"};
  assert(EncodeKey(KeyMode::kNameOnly, key) == "clip.mp4");
  assert(EncodeKey(KeyMode::kFull, key) == std::string("GDRIVE\x1f") + "1AbC\x1f" + "clip.mp4");

  // same name from a different source is a different full key
  DedupKey other{SourceKind::kLocal, "1AbC", "clip.mp4"};
  assert(EncodeKey(KeyMode::kFull, key) != EncodeKey(KeyMode::kFull, other));
  assert(EncodeKey(KeyMode::kNameOnly, key) == EncodeKey(KeyMode::kNameOnly, other));
}

void TestSqliteRecordsAndPersists() {
  auto dir  = twiper::testing::TempDir("dedup_sqlite");
  auto path = (dir / "nested" / "posted.db").string();

  {
    SqliteDedupStore store(path);
    assert(store.Mode() == KeyMode::kFull);
    assert(store.ListSeen().empty());

    assert(store.RecordPosted(Record(SourceKind::kLocal, "/media/a.mp4", "a.mp4")));
    assert(store.RecordPosted(Record(SourceKind::kCloudDrive, "fileid", "a.mp4")));
    assert(store.Count() == 2);

    // idempotent
    assert(store.RecordPosted(Record(SourceKind::kLocal, "/media/a.mp4", "a.mp4", "other-post")));
    assert(store.Count() == 2);
  }

  SqliteDedupStore reopened(path);
  assert(reopened.Count() == 2);
  auto seen = reopened.ListSeen();
  assert(seen.size() == 2);
  assert(Contains(seen, EncodeKey(KeyMode::kFull, {SourceKind::kLocal, "/media/a.mp4", "a.mp4"})));
  assert(Contains(seen, EncodeKey(KeyMode::kFull, {SourceKind::kCloudDrive, "fileid", "a.mp4"})));
}

void TestSqliteEmptyPartsAreUnique() {
  auto dir = twiper::testing::TempDir("dedup_sqlite_null");
  SqliteDedupStore store((dir / "posted.db").string());

  // empty handle is stored as NULL; the COALESCE index still dedups it
  assert(store.RecordPosted(Record(SourceKind::kAccountStorage, "", "b.png")));
  assert(store.RecordPosted(Record(SourceKind::kAccountStorage, "", "b.png")));
  assert(store.Count() == 1);
  assert(store.ListSeen().front() == EncodeKey(KeyMode::kFull, {SourceKind::kAccountStorage, "", "b.png"}));
}

void TestSqliteSkipsUnknownSources() {
  auto dir = twiper::testing::TempDir("dedup_sqlite_unknown");
  auto db  = std::make_shared<twiper::dedup::sqlite::SqliteDB>((dir / "posted.db").string());
  SqliteDedupStore store(db);

  db->Exec("INSERT INTO posted_media (source, handle, name, tweet_id, posted_at) VALUES ('MEGA', 'h', 'x.mp4', '9', 0);");
  assert(store.RecordPosted(Record(SourceKind::kLocal, "/m/y.mp4", "y.mp4")));

  assert(store.Count() == 2);
  assert(store.ListSeen().size() == 1);
}

void TestJsonRecordsAndPersists() {
  auto dir  = twiper::testing::TempDir("dedup_json");
  auto path = dir / "posted.json";

  {
    JsonDedupStore store(path);
    assert(store.Mode() == KeyMode::kNameOnly);
    assert(store.ListSeen().empty());

    assert(store.RecordPosted(Record(SourceKind::kCloudDrive, "id-2", "b.mp4")));
    assert(store.RecordPosted(Record(SourceKind::kCloudDrive, "id-1", "a.mp4")));
    assert(store.RecordPosted(Record(SourceKind::kLocal, "/x/a.mp4", "a.mp4")));
    assert(store.RecordPosted(Record(SourceKind::kLocal, "/x/", "")));
  }

  assert(!std::filesystem::exists(dir / "posted.json.tmp"));

  const auto text = ReadFile(path);
  assert(text.find("\"a.mp4\"") != std::string::npos);
  assert(text.find("\"b.mp4\"") != std::string::npos);
  assert(text.find("\"\"") == std::string::npos);
  assert(text.find("\"a.mp4\"") < text.find("\"b.mp4\""));

  JsonDedupStore reopened(path);
  auto seen = reopened.ListSeen();
  assert(seen.size() == 2);
  assert(seen[0] == "a.mp4" && seen[1] == "b.mp4");
}

void TestJsonAcceptsEmptyAndMissingFiles() {
  auto dir = twiper::testing::TempDir("dedup_json_empty");
  {
    std::ofstream out(dir / "blank.json");
    out << "  \n";
  }
  assert(JsonDedupStore(dir / "blank.json").ListSeen().empty());
  assert(JsonDedupStore(dir / "missing" / "posted.json").ListSeen().empty());
}

void TestJsonRejectsMalformedFile() {
  auto dir = twiper::testing::TempDir("dedup_json_bad");
  {
    std::ofstream out(dir / "posted.json");
    out << "[\"a.mp4\", ";
  }

  bool threw = false;
  try {
    JsonDedupStore store(dir / "posted.json");
  } catch (const twiper::util::StoreError&) {
    threw = true;
  }
  assert(threw);
}

void TestJsonKeepsOnlyIntegralNumbers() {
  auto dir = twiper::testing::TempDir("dedup_json_numbers");
  {
    std::ofstream out(dir / "posted.json");
    out << R"(["a.mp4", 42, -7, 1e300, 1e20, 1.5, true, null, {"name":"x"}])";
  }

  JsonDedupStore store(dir / "posted.json");
  auto           seen = store.ListSeen();
  assert(seen.size() == 3);
  assert(Contains(seen, "a.mp4"));
  assert(Contains(seen, "42"));
  assert(Contains(seen, "-7"));
}

void TestJsonPersistsBesideRelativePath() {
  auto       dir      = twiper::testing::TempDir("dedup_json_relative");
  const auto previous = std::filesystem::current_path();
  std::filesystem::current_path(dir);

  {
    JsonDedupStore store("posted.json");
    assert(store.RecordPosted(Record(SourceKind::kLocal, "/x/c.mp4", "c.mp4")));
  }

  std::filesystem::current_path(previous);
  auto seen = JsonDedupStore(dir / "posted.json").ListSeen();
  assert(seen.size() == 1 && seen[0] == "c.mp4");
  assert(!std::filesystem::exists(dir / "posted.json.tmp"));
}

} // namespace

int main() {
  TestKeyEncoding();
  TestSqliteRecordsAndPersists();
  TestSqliteEmptyPartsAreUnique();
  TestSqliteSkipsUnknownSources();
  TestJsonRecordsAndPersists();
  TestJsonAcceptsEmptyAndMissingFiles();
  TestJsonRejectsMalformedFile();
  TestJsonKeepsOnlyIntegralNumbers();
  TestJsonPersistsBesideRelativePath();

  std::cout << "twiper_unit_dedup_store: pass\n";
  return 0;
}
