#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/dedup/dedup_store.hpp"
#include "internal/source/source_adapter.hpp"

namespace twiper::selection {

/*
  Decides what to post next.

  The seen set is loaded from the dedup store once, at construction. A key
  enters the set only after the store has durably recorded it, so a crash
  between post and record can at worst repost one item, never skip one.
*/
class SelectionEngine {
 public:
  // Throws StoreError when the store cannot be read.
  explicit SelectionEngine(dedup::DedupStorePtr store);

  /*
    Every candidate of an enumerable source, newest first (ties by name,
    then handle). A non-enumerable source yields its single item as is.
  */
  std::vector<model::MediaCandidate> ListCandidates(source::SourceAdapter& source) const;

  bool IsPosted(const model::MediaCandidate& candidate) const;

  /*
    Up to `limit` unposted candidates in listing order; 0 means no limit.
    Non-enumerable sources bypass dedup and yield at most one candidate.
  */
  std::vector<model::MediaCandidate> SelectNext(source::SourceAdapter& source, std::size_t limit) const;

  // Persists the record, then marks the key seen. Repeating a key is a no-op.
  dedup::Result RecordPosted(const model::MediaCandidate& candidate, const std::string& post_id);

  std::size_t SeenCount() const {
    return seen_.size();
  }

  // Newest first, then name, then handle.
  static void SortCandidates(std::vector<model::MediaCandidate>* candidates);

 private:
  std::string KeyFor(const model::MediaCandidate& candidate) const;

  dedup::DedupStorePtr            store_;
  std::unordered_set<std::string> seen_;
};

} // namespace twiper::selection
