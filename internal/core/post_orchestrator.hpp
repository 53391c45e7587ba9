#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/caption/caption_resolver.hpp"
#include "internal/post/post_client.hpp"
#include "internal/selection/selection_engine.hpp"
#include "internal/source/source_adapter.hpp"
#include "internal/upload/chunked_uploader.hpp"

namespace twiper::core {

struct RunReport {
  std::size_t attempted = 0;
  std::size_t posted    = 0;
  std::size_t failed    = 0;
  // posted remotely but the dedup record could not be written
  std::size_t unrecorded = 0;

  std::vector<std::string> post_ids;
};

/*
  One run: select, then for each candidate

      Download -> caption -> Upload -> CreatePost -> RecordPosted -> Cleanup

  A failure before the post leaves no record and no cleanup; the candidate
  stays eligible for the next run. Failures never stop the run.
*/
class PostOrchestrator {
 public:
  PostOrchestrator(source::SourceAdapterPtr source, std::shared_ptr<selection::SelectionEngine> selection,
                   std::shared_ptr<upload::ChunkedUploader> uploader, std::shared_ptr<post::PostClient> poster,
                   caption::CaptionResolverPtr captions);

  // `limit` 0 means every unposted candidate. Throws SourceError when listing fails.
  RunReport Run(std::size_t limit);

 private:
  enum class Outcome { kPosted, kFailed, kUnrecorded };

  Outcome Process(const model::MediaCandidate& candidate, RunReport* report);

  source::SourceAdapterPtr                   source_;
  std::shared_ptr<selection::SelectionEngine> selection_;
  std::shared_ptr<upload::ChunkedUploader>   uploader_;
  std::shared_ptr<post::PostClient>          poster_;
  caption::CaptionResolverPtr                captions_;
};

} // namespace twiper::core
