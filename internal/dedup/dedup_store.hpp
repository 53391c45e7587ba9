#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/dedup/result.hpp"
#include "internal/model/media_candidate.hpp"
#include "internal/util/time.hpp"

namespace twiper::dedup {

enum class KeyMode {
  kFull,      // (source_kind, handle, name)
  kNameOnly,  // name
};

struct DedupKey {
  model::SourceKind source_kind = model::SourceKind::kLocal;
  std::string       handle;
  std::string       name;

  static DedupKey For(const model::MediaCandidate& candidate) {
    return {candidate.source_kind, candidate.handle, candidate.name};
  }
};

struct PostedRecord {
  DedupKey        key;
  std::string     post_id;
  util::TimePoint posted_at{};
};

// Canonical string form of a key; the unit of the in-memory seen set.
std::string EncodeKey(KeyMode mode, const DedupKey& key);

/*
  Durable record of what has been posted.

  Read once at startup through ListSeen(); appended to after each
  successful post. RecordPosted() returns only after the record is on
  disk, and recording an existing key is a successful no-op.

  Single writer, single process.
*/
class DedupStore {
 public:
  virtual ~DedupStore() = default;

  virtual KeyMode Mode() const = 0;

  // Encoded keys of every stored record. Throws StoreError if unreadable.
  virtual std::vector<std::string> ListSeen() = 0;

  virtual Result RecordPosted(const PostedRecord& record) = 0;
};

using DedupStorePtr = std::shared_ptr<DedupStore>;

} // namespace twiper::dedup
