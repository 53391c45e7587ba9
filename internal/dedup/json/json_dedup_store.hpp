#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "internal/dedup/dedup_store.hpp"

namespace twiper::dedup::json {

/*
  Name-only dedup store kept as a sorted JSON array of file names.

  Every new name rewrites the whole file:

      write <path>.tmp -> fsync -> rename over <path> -> fsync dir

  so a crash leaves either the old or the new array, never a torn file.
  Empty names are never recorded.
*/
class JsonDedupStore final : public DedupStore {
 public:
  // Loads the array if the file exists. Throws StoreError on unreadable or malformed content.
  explicit JsonDedupStore(std::filesystem::path path);

  KeyMode Mode() const override {
    return KeyMode::kNameOnly;
  }

  std::vector<std::string> ListSeen() override;

  Result RecordPosted(const PostedRecord& record) override;

 private:
  void Load();
  void Persist() const;

  std::filesystem::path path_;
  std::set<std::string> names_;
};

} // namespace twiper::dedup::json
