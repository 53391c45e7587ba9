#include "internal/core/post_orchestrator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "support/fakes.hpp"

namespace {

using twiper::core::PostOrchestrator;
using twiper::http::HttpRequest;
using twiper::http::HttpResponse;
using twiper::testing::Candidate;
using twiper::testing::FakeDedupStore;
using twiper::testing::FakeHttpClient;
using twiper::testing::FakeSource;
using twiper::testing::Field;
using twiper::testing::Reply;

constexpr const char* kUploadUrl = "https://upload.test/1.1/media/upload.json";
constexpr const char* kPostUrl   = "https://api.test/2/tweets";

// Upload sizes that the fake remote rejects at INIT, and media ids whose post is refused.
constexpr const char* kRejectedInitSize = "13";
constexpr const char* kRefusedMediaId   = "m17";
// Media whose every APPEND gets a 503.
constexpr const char* kUnavailableMediaId = "m11";

class FakeCaptions final : public twiper::caption::CaptionResolver {
 public:
  std::optional<std::string> Resolve(const std::filesystem::path& media_path) override {
    resolved.push_back(media_path.filename().string());
    return "caption for " + media_path.filename().string();
  }

  std::vector<std::string> resolved;
};

// Media id is "m<total_bytes>" so a candidate's size routes its fate.
HttpResponse Remote(const HttpRequest& request) {
  if (request.url == kPostUrl) {
    if (request.body.find(kRefusedMediaId) != std::string::npos) {
      return Reply(403, R"({"detail":"duplicate content"})");
    }
    return Reply(201, R"({"data":{"id":"post-)" + std::to_string(request.body.size()) + R"("}})");
  }

  const auto command = Field(request, "command");
  if (command == "INIT") {
    const auto size = Field(request, "total_bytes");
    if (size == kRejectedInitSize) return Reply(400, "bad media");
    return Reply(202, R"({"media_id_string":"m)" + size + R"("})");
  }
  if (command == "APPEND") {
    if (Field(request, "media_id") == kUnavailableMediaId) return Reply(503, "over capacity");
    return Reply(204);
  }
  return Reply(201, R"({"media_id_string":")" + Field(request, "media_id") + R"("})");
}

struct Harness {
  std::shared_ptr<FakeSource>     source   = std::make_shared<FakeSource>();
  std::shared_ptr<FakeDedupStore> store    = std::make_shared<FakeDedupStore>();
  std::shared_ptr<FakeHttpClient> http     = std::make_shared<FakeHttpClient>();
  std::shared_ptr<FakeCaptions>   captions = std::make_shared<FakeCaptions>();
  std::shared_ptr<twiper::selection::SelectionEngine> selection;

  Harness() {
    http->handler = Remote;
  }

  PostOrchestrator Orchestrator() {
    selection = std::make_shared<twiper::selection::SelectionEngine>(store);

    twiper::upload::UploadOptions options;
    options.endpoint = kUploadUrl;
    auto signer      = std::make_shared<twiper::testing::StubSigner>();
    auto uploader    = std::make_shared<twiper::upload::ChunkedUploader>(http, signer, options, std::make_shared<twiper::testing::FakeSleeper>());
    auto poster      = std::make_shared<twiper::post::PostClient>(http, signer, kPostUrl);
    return PostOrchestrator(source, selection, uploader, poster, captions);
  }

  std::vector<std::string> PostBodies() const {
    std::vector<std::string> bodies;
    for (const auto& request : http->requests) {
      if (request.url == kPostUrl) bodies.push_back(request.body);
    }
    return bodies;
  }
};

void TestPostsNewestFirstThenRecordsAndCleans() {
  Harness h;
  h.source->items = {Candidate("old.mp4", 100, 20), Candidate("new.mp4", 300, 30), Candidate("mid.mp4", 200, 25)};

  auto report = h.Orchestrator().Run(0);
  assert(report.attempted == 3);
  assert(report.posted == 3);
  assert(report.failed == 0);
  assert(report.unrecorded == 0);
  assert(report.post_ids.size() == 3);

  assert((h.source->cleaned == std::vector<std::string>{"new.mp4", "mid.mp4", "old.mp4"}));
  assert(h.store->records.size() == 3);
  assert(h.store->records[0].key.name == "new.mp4");
  assert(h.store->records[0].post_id == report.post_ids[0]);

  const auto bodies = h.PostBodies();
  assert(bodies.size() == 3);
  assert(bodies[0] == R"({"text":"caption for new.mp4","media":{"media_ids":["m30"]}})");
  assert((h.captions->resolved == std::vector<std::string>{"new.mp4", "mid.mp4", "old.mp4"}));
}

void TestFailuresAreIsolated() {
  Harness h;
  h.source->items = {
      Candidate("download-fails.mp4", 400, 20),
      Candidate("init-rejected.mp4", 300, 13),
      Candidate("post-refused.mp4", 200, 17),
      Candidate("fine.mp4", 100, 21),
  };
  h.source->fail_download.insert("download-fails.mp4");

  auto orchestrator = h.Orchestrator();
  auto report       = orchestrator.Run(0);
  assert(report.attempted == 4);
  assert(report.posted == 1);
  assert(report.failed == 3);

  assert((h.source->cleaned == std::vector<std::string>{"fine.mp4"}));
  assert(h.store->records.size() == 1);
  assert(h.store->records[0].key.name == "fine.mp4");

  // failed candidates stay eligible
  assert(!h.selection->IsPosted(h.source->items[0]));
  assert(!h.selection->IsPosted(h.source->items[1]));
  assert(!h.selection->IsPosted(h.source->items[2]));
  assert(h.selection->IsPosted(h.source->items[3]));

  // the refused post was attempted, the rejected upload never reached posting
  const auto bodies = h.PostBodies();
  assert(bodies.size() == 2);
}

void TestExhaustedAppendLeavesCandidateEligible() {
  Harness h;
  h.source->items = {Candidate("flaky.mp4", 200, 11), Candidate("steady.mp4", 100, 21)};

  auto report = h.Orchestrator().Run(0);
  assert(report.attempted == 2);
  assert(report.failed == 1);
  assert(report.posted == 1);

  std::size_t flaky_appends = 0;
  for (const auto& request : h.http->requests) {
    if (Field(request, "command") == "APPEND" && Field(request, "media_id") == kUnavailableMediaId) ++flaky_appends;
  }
  assert(flaky_appends == 5);
  assert(h.http->CountCommand("FINALIZE") == 1);

  const auto bodies = h.PostBodies();
  assert(bodies.size() == 1);
  assert(bodies[0].find(kUnavailableMediaId) == std::string::npos);

  assert(h.store->records.size() == 1);
  assert(h.store->records[0].key.name == "steady.mp4");
  assert((h.source->cleaned == std::vector<std::string>{"steady.mp4"}));
  assert(!h.selection->IsPosted(h.source->items[0]));
}

void TestUnrecordedPostSkipsCleanup() {
  Harness h;
  h.source->items       = {Candidate("a.mp4", 100, 20)};
  h.store->fail_records = true;

  auto report = h.Orchestrator().Run(0);
  assert(report.posted == 1);
  assert(report.unrecorded == 1);
  assert(report.failed == 0);
  assert(report.post_ids.size() == 1);
  assert(h.store->record_calls == 1);
  assert(h.source->cleaned.empty());
}

void TestLimitAndAlreadyPosted() {
  Harness h;
  h.source->items = {Candidate("a.mp4", 100, 20), Candidate("b.mp4", 300, 20), Candidate("c.mp4", 200, 20)};
  h.store->keys.insert(twiper::dedup::EncodeKey(twiper::dedup::KeyMode::kFull, twiper::dedup::DedupKey::For(h.source->items[1])));

  auto report = h.Orchestrator().Run(1);
  assert(report.attempted == 1);
  assert((h.source->cleaned == std::vector<std::string>{"c.mp4"}));
}

void TestNothingToPost() {
  Harness h;
  auto    report = h.Orchestrator().Run(0);
  assert(report.attempted == 0);
  assert(report.posted == 0);
  assert(h.http->requests.empty());
  assert(h.source->list_calls == 1);
}

void TestListingFailurePropagates() {
  class BrokenSource final : public twiper::source::SourceAdapter {
   public:
    twiper::model::SourceKind Kind() const override {
      return twiper::model::SourceKind::kCloudDrive;
    }
    bool CanEnumerate() const override {
      return true;
    }
    std::vector<twiper::model::MediaCandidate> ListCandidates() override {
      throw twiper::util::SourceError("drive list failed: 401");
    }
    twiper::model::DownloadedMedia Download(const twiper::model::MediaCandidate&) override {
      return {};
    }
    void Cleanup(const twiper::model::MediaCandidate&, const std::filesystem::path&) override {
    }
  };

  auto store     = std::make_shared<FakeDedupStore>();
  auto http      = std::make_shared<FakeHttpClient>();
  auto signer    = std::make_shared<twiper::testing::StubSigner>();
  auto uploader  = std::make_shared<twiper::upload::ChunkedUploader>(http, signer, twiper::upload::UploadOptions{},
                                                                     std::make_shared<twiper::testing::FakeSleeper>());
  PostOrchestrator orchestrator(std::make_shared<BrokenSource>(), std::make_shared<twiper::selection::SelectionEngine>(store), uploader,
                                std::make_shared<twiper::post::PostClient>(http, signer), std::make_shared<FakeCaptions>());

  bool threw = false;
  try {
    (void)orchestrator.Run(0);
  } catch (const twiper::util::SourceError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPostsNewestFirstThenRecordsAndCleans();
  TestFailuresAreIsolated();
  TestExhaustedAppendLeavesCandidateEligible();
  TestUnrecordedPostSkipsCleanup();
  TestLimitAndAlreadyPosted();
  TestNothingToPost();
  TestListingFailurePropagates();

  std::cout << "twiper_unit_post_orchestrator: pass\n";
  return 0;
}
