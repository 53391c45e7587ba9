#include "post_orchestrator.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace twiper::core {

using observability::IntField;
using observability::StringField;

namespace {

void LogFailure(const model::MediaCandidate& candidate, const char* stage, const char* kind, const std::string& error) {
  TWIPER_LOG_ERROR("candidate failed", {StringField("name", candidate.name), StringField("handle", candidate.handle), StringField("stage", stage),
                                        StringField("kind", kind), StringField("error", error)});
}

} // namespace

PostOrchestrator::PostOrchestrator(source::SourceAdapterPtr source, std::shared_ptr<selection::SelectionEngine> selection,
                                   std::shared_ptr<upload::ChunkedUploader> uploader, std::shared_ptr<post::PostClient> poster,
                                   caption::CaptionResolverPtr captions)
    : source_(std::move(source)),
      selection_(std::move(selection)),
      uploader_(std::move(uploader)),
      poster_(std::move(poster)),
      captions_(std::move(captions)) {
  if (!source_ || !selection_ || !uploader_ || !poster_ || !captions_) {
    throw std::invalid_argument("PostOrchestrator requires source, selection, uploader, poster and caption resolver");
  }
}

RunReport PostOrchestrator::Run(std::size_t limit) {
  RunReport report;

  const auto candidates = selection_->SelectNext(*source_, limit);
  if (candidates.empty()) {
    TWIPER_LOG_INFO("nothing to post", {StringField("source", model::SourceKindName(source_->Kind()))});
    return report;
  }

  for (const auto& candidate : candidates) {
    ++report.attempted;
    switch (Process(candidate, &report)) {
      case Outcome::kPosted:
        ++report.posted;
        break;
      case Outcome::kUnrecorded:
        ++report.posted;
        ++report.unrecorded;
        break;
      case Outcome::kFailed:
        ++report.failed;
        break;
    }
  }

  TWIPER_LOG_INFO("run complete", {IntField("attempted", static_cast<std::int64_t>(report.attempted)),
                                   IntField("posted", static_cast<std::int64_t>(report.posted)),
                                   IntField("failed", static_cast<std::int64_t>(report.failed)),
                                   IntField("unrecorded", static_cast<std::int64_t>(report.unrecorded))});
  return report;
}

PostOrchestrator::Outcome PostOrchestrator::Process(const model::MediaCandidate& candidate, RunReport* report) {
  TWIPER_LOG_INFO("posting candidate", {StringField("name", candidate.name), StringField("handle", candidate.handle),
                                        IntField("bytes", static_cast<std::int64_t>(candidate.size_bytes))});

  model::DownloadedMedia media;
  try {
    media = source_->Download(candidate);
  } catch (const util::SourceError& e) {
    LogFailure(candidate, "download", "source", e.what());
    return Outcome::kFailed;
  }

  std::string post_id;
  try {
    auto caption = captions_->Resolve(media.local_path);

    upload::MediaDescriptor descriptor;
    descriptor.media_type     = candidate.media_type;
    descriptor.media_category = model::UploadCategory(candidate);
    descriptor.filename       = candidate.name;

    const auto media_id = uploader_->UploadOrThrow(media.bytes, descriptor);
    post_id             = poster_->CreatePost(caption.value_or(""), {media_id});
  } catch (const upload::UploadError& e) {
    LogFailure(candidate, "upload", upload::ReasonTag(e.Reason()), e.what());
    return Outcome::kFailed;
  } catch (const util::TransientNetworkError& e) {
    LogFailure(candidate, "post", "network", e.what());
    return Outcome::kFailed;
  } catch (const util::ProtocolError& e) {
    LogFailure(candidate, "post", "protocol", e.what());
    return Outcome::kFailed;
  } catch (const util::ProcessingFailure& e) {
    LogFailure(candidate, "upload", "processing", e.what());
    return Outcome::kFailed;
  }

  report->post_ids.push_back(post_id);

  auto recorded = selection_->RecordPosted(candidate, post_id);
  if (!recorded) {
    TWIPER_LOG_ERROR("posted but not recorded; cleanup skipped",
                     {StringField("name", candidate.name), StringField("post_id", post_id), StringField("code", dedup::ErrorCodeName(recorded.code)),
                      StringField("error", recorded.message)});
    return Outcome::kUnrecorded;
  }

  try {
    source_->Cleanup(candidate, media.temporary ? media.local_path : std::filesystem::path{});
  } catch (const util::SourceError& e) {
    TWIPER_LOG_WARN("cleanup failed", {StringField("name", candidate.name), StringField("error", e.what())});
  }

  TWIPER_LOG_INFO("candidate posted", {StringField("name", candidate.name), StringField("post_id", post_id)});
  return Outcome::kPosted;
}

} // namespace twiper::core
