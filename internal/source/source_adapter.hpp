#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "internal/model/media_candidate.hpp"

namespace twiper::source {

/*
  Media source abstraction.

  Every candidate's bytes are handed out as an Arrow Buffer together with
  a local path (used for caption lookup).

  Implementations:
    LOCAL   -> folder on the local filesystem
    OBJECT  -> any Arrow filesystem URI (s3://, gs://, abfs://, file://)
    GDRIVE  -> Drive v3 REST, folder walk or a single shared link

  Backend failures throw util::SourceError.
*/
class SourceAdapter {
 public:
  virtual ~SourceAdapter() = default;

  virtual model::SourceKind Kind() const = 0;

  /*
    False for sources that expose exactly one fixed item (shared link).
    Such sources bypass dedup and are posted at most once per run.
  */
  virtual bool CanEnumerate() const = 0;

  // All candidates, unordered. The selection engine owns ordering.
  virtual std::vector<model::MediaCandidate> ListCandidates() = 0;

  virtual model::DownloadedMedia Download(const model::MediaCandidate& candidate) = 0;

  /*
    Called only after the post is recorded. Removes or archives the remote
    item according to the backend settings and deletes `local_path` when the
    source created it.
  */
  virtual void Cleanup(const model::MediaCandidate& candidate, const std::filesystem::path& local_path) = 0;
};

using SourceAdapterPtr = std::shared_ptr<SourceAdapter>;

} // namespace twiper::source
