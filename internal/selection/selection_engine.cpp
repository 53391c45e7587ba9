#include "selection_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

#include "internal/observability/logging.hpp"

namespace twiper::selection {

using observability::IntField;
using observability::StringField;

SelectionEngine::SelectionEngine(dedup::DedupStorePtr store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("SelectionEngine requires a dedup store");
  }
  for (auto& key : store_->ListSeen()) {
    seen_.insert(std::move(key));
  }
  TWIPER_LOG_DEBUG("dedup store loaded", {IntField("seen", static_cast<std::int64_t>(seen_.size()))});
}

void SelectionEngine::SortCandidates(std::vector<model::MediaCandidate>* candidates) {
  std::sort(candidates->begin(), candidates->end(), [](const model::MediaCandidate& a, const model::MediaCandidate& b) {
    if (a.modified_at != b.modified_at) return a.modified_at > b.modified_at;
    return std::tie(a.name, a.handle) < std::tie(b.name, b.handle);
  });
}

std::vector<model::MediaCandidate> SelectionEngine::ListCandidates(source::SourceAdapter& source) const {
  auto candidates = source.ListCandidates();
  if (source.CanEnumerate()) {
    SortCandidates(&candidates);
  }
  return candidates;
}

std::string SelectionEngine::KeyFor(const model::MediaCandidate& candidate) const {
  return dedup::EncodeKey(store_->Mode(), dedup::DedupKey::For(candidate));
}

bool SelectionEngine::IsPosted(const model::MediaCandidate& candidate) const {
  return seen_.count(KeyFor(candidate)) > 0;
}

std::vector<model::MediaCandidate> SelectionEngine::SelectNext(source::SourceAdapter& source, std::size_t limit) const {
  auto candidates = ListCandidates(source);

  if (!source.CanEnumerate()) {
    if (candidates.size() > 1) candidates.resize(1);
    return candidates;
  }

  std::vector<model::MediaCandidate> selected;
  std::size_t                        skipped = 0;
  for (auto& candidate : candidates) {
    if (limit != 0 && selected.size() >= limit) break;
    if (IsPosted(candidate)) {
      ++skipped;
      continue;
    }
    selected.push_back(std::move(candidate));
  }

  TWIPER_LOG_INFO("selection complete",
                  {StringField("source", model::SourceKindName(source.Kind())), IntField("listed", static_cast<std::int64_t>(candidates.size())),
                   IntField("already_posted", static_cast<std::int64_t>(skipped)), IntField("selected", static_cast<std::int64_t>(selected.size()))});
  return selected;
}

dedup::Result SelectionEngine::RecordPosted(const model::MediaCandidate& candidate, const std::string& post_id) {
  auto key = KeyFor(candidate);
  if (seen_.count(key) > 0) {
    return dedup::Result::Ok();
  }

  dedup::PostedRecord record;
  record.key       = dedup::DedupKey::For(candidate);
  record.post_id   = post_id;
  record.posted_at = util::Now();

  auto result = store_->RecordPosted(record);
  if (result) {
    seen_.insert(std::move(key));
  }
  return result;
}

} // namespace twiper::selection
