#include "internal/upload/chunked_uploader.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "support/fakes.hpp"

namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;
using twiper::http::HttpRequest;
using twiper::http::HttpResponse;
using twiper::testing::FakeHttpClient;
using twiper::testing::FakeSleeper;
using twiper::testing::Field;
using twiper::testing::Reply;
using twiper::testing::StubSigner;
using twiper::testing::TransportFailure;
using twiper::upload::ChunkedUploader;
using twiper::upload::FailureReason;
using twiper::upload::UploadOptions;
using twiper::upload::UploadState;

constexpr const char* kInitOk = R"({"media_id_string":"710511363345354753","size":10,"expires_after_secs":86400})";

struct Harness {
  std::shared_ptr<FakeHttpClient> http    = std::make_shared<FakeHttpClient>();
  std::shared_ptr<StubSigner>     signer  = std::make_shared<StubSigner>();
  std::shared_ptr<FakeSleeper>    sleeper = std::make_shared<FakeSleeper>();
  UploadOptions                   options;

  Harness() {
    options.endpoint         = "https://upload.test/1.1/media/upload.json";
    options.chunk_size_bytes = 4;
  }

  ChunkedUploader Uploader() const {
    return ChunkedUploader(http, signer, options, sleeper);
  }
};

twiper::upload::MediaDescriptor Video() {
  return {"video/mp4", "tweet_video", "clip.mp4"};
}

std::shared_ptr<arrow::Buffer> Bytes(const std::string& text) {
  return arrow::Buffer::FromString(text);
}

std::string MediaPart(const HttpRequest& request) {
  for (const auto& part : request.parts) {
    if (part.name == "media" && part.data) return part.data->ToString();
  }
  return {};
}

// INIT ok, APPEND ok, FINALIZE answers `finalize`, STATUS answers from `status` in order.
FakeHttpClient::Handler Script(std::string finalize, std::vector<HttpResponse> status = {}) {
  auto remaining = std::make_shared<std::vector<HttpResponse>>(std::move(status));
  auto index     = std::make_shared<std::size_t>(0);
  return [finalize, remaining, index](const HttpRequest& request) -> HttpResponse {
    const auto command = Field(request, "command");
    if (command == "INIT") return Reply(202, kInitOk);
    if (command == "APPEND") return Reply(204);
    if (command == "FINALIZE") return Reply(201, finalize);
    assert(command == "STATUS");
    assert(*index < remaining->size());
    return (*remaining)[(*index)++];
  };
}

void TestPendingThenSucceeded() {
  Harness h;
  h.http->handler = Script(R"({"media_id_string":"710511363345354753","processing_info":{"state":"pending","check_after_secs":2}})",
                           {Reply(200, R"({"processing_info":{"state":"in_progress","check_after_secs":3,"progress_percent":40}})"),
                            Reply(200, R"({"processing_info":{"state":"succeeded","progress_percent":100}})")});

  auto result = h.Uploader().Upload(Bytes("0123456789"), Video());

  assert(result.Succeeded());
  assert(result.MediaId() == "710511363345354753");
  assert(result.session.bytes_sent == 10);
  assert(result.session.chunk_index == 3);

  const auto& requests = h.http->requests;
  assert(requests.size() == 1 + 3 + 1 + 2);

  assert(Field(requests[0], "total_bytes") == "10");
  assert(Field(requests[0], "media_type") == "video/mp4");
  assert(Field(requests[0], "media_category") == "tweet_video");
  assert(requests[0].body_kind == twiper::http::BodyKind::kForm);

  std::string reassembled;
  for (int i = 0; i < 3; ++i) {
    const auto& append = requests[1 + i];
    assert(append.body_kind == twiper::http::BodyKind::kMultipart);
    assert(Field(append, "media_id") == "710511363345354753");
    assert(Field(append, "segment_index") == std::to_string(i));
    reassembled += MediaPart(append);
  }
  assert(reassembled == "0123456789");

  assert(requests[5].method == twiper::http::Method::kGet);
  assert(Field(requests[5], "media_id") == "710511363345354753");

  for (const auto& request : requests) {
    assert(twiper::testing::Header(request, "Authorization") == "OAuth stub");
  }
  assert(h.signer->signed_requests == static_cast<int>(requests.size()));

  assert(h.sleeper->sleeps.size() == 2);
  assert(h.sleeper->sleeps[0] == seconds(2));
  assert(h.sleeper->sleeps[1] == seconds(3));
}

void TestFinalizeWithoutProcessingInfoSucceeds() {
  Harness h;
  h.http->handler = Script(R"({"media_id_string":"710511363345354753","size":10})");

  auto result = h.Uploader().Upload(Bytes("img"), {"image/png", "tweet_image", "a.png"});
  assert(result.Succeeded());
  assert(h.http->CountCommand("STATUS") == 0);
  assert(h.sleeper->sleeps.empty());
}

void TestTransientAppendIsRetriedWithBackoff() {
  Harness h;
  int     append_calls = 0;
  h.http->handler      = [&append_calls](const HttpRequest& request) -> HttpResponse {
    const auto command = Field(request, "command");
    if (command == "INIT") return Reply(202, kInitOk);
    if (command == "APPEND") {
      ++append_calls;
      if (append_calls == 1) return Reply(503, "over capacity");
      if (append_calls == 2) return TransportFailure();
      return Reply(204);
    }
    return Reply(201, R"({"media_id_string":"710511363345354753"})");
  };

  auto result = h.Uploader().Upload(Bytes("abc"), Video());
  assert(result.Succeeded());
  assert(append_calls == 3);

  assert(h.sleeper->sleeps.size() == 2);
  assert(h.sleeper->sleeps[0] >= milliseconds(5'000) && h.sleeper->sleeps[0] < milliseconds(5'500));
  assert(h.sleeper->sleeps[1] >= milliseconds(10'000) && h.sleeper->sleeps[1] < milliseconds(10'500));
}

void TestAppendExhaustion() {
  Harness h;
  h.http->handler = [](const HttpRequest& request) -> HttpResponse {
    if (Field(request, "command") == "INIT") return Reply(202, kInitOk);
    return Reply(503, "unavailable");
  };

  auto result = h.Uploader().Upload(Bytes("abcdef"), Video());
  assert(result.session.state == UploadState::kFailed);
  assert(result.session.failure_reason == FailureReason::kChunkUploadExhausted);
  assert(result.session.failed_in == UploadState::kAppending);
  assert(result.session.chunk_index == 0);
  assert(h.http->CountCommand("APPEND") == 5);
  assert(h.http->CountCommand("FINALIZE") == 0);
  assert(h.sleeper->sleeps.size() == 4);
}

void TestClientErrorOnAppendIsNotRetried() {
  Harness h;
  h.http->handler = [](const HttpRequest& request) -> HttpResponse {
    if (Field(request, "command") == "INIT") return Reply(202, kInitOk);
    return Reply(400, R"({"errors":[{"message":"bad segment"}]})");
  };

  auto result = h.Uploader().Upload(Bytes("abcdef"), Video());
  assert(result.session.failure_reason == FailureReason::kAppendRejected);
  assert(h.http->CountCommand("APPEND") == 1);
  assert(h.sleeper->sleeps.empty());
}

void TestInitRejectionIsNeverRetried() {
  for (const auto& reply : {Reply(400, "bad request"), TransportFailure(), Reply(200, "{}")}) {
    Harness h;
    h.http->Enqueue(reply);

    auto result = h.Uploader().Upload(Bytes("abc"), Video());
    assert(result.session.state == UploadState::kFailed);
    assert(result.session.failure_reason == FailureReason::kInitRejected);
    assert(result.session.failed_in == UploadState::kIdle);
    assert(h.http->requests.size() == 1);
  }
}

void TestEmptyPayloadFailsWithoutNetwork() {
  Harness h;
  auto    result = h.Uploader().Upload(Bytes(""), Video());
  assert(result.session.failure_reason == FailureReason::kInitRejected);
  assert(h.http->requests.empty());
}

void TestFinalizeRejected() {
  Harness h;
  h.http->handler = [](const HttpRequest& request) -> HttpResponse {
    const auto command = Field(request, "command");
    if (command == "INIT") return Reply(202, kInitOk);
    if (command == "APPEND") return Reply(204);
    return Reply(400, "invalid media");
  };

  auto result = h.Uploader().Upload(Bytes("abc"), Video());
  assert(result.session.failure_reason == FailureReason::kFinalizeRejected);
}

void TestProcessingFailureCarriesRemoteMessage() {
  Harness h;
  h.http->handler = Script(R"({"processing_info":{"state":"in_progress","check_after_secs":1}})",
                           {Reply(200, R"({"processing_info":{"state":"failed","error":{"code":1,"name":"InvalidMedia","message":"Unsupported video format"}}})")});

  auto result = h.Uploader().Upload(Bytes("abc"), Video());
  assert(result.session.failure_reason == FailureReason::kProcessingFailed);
  assert(result.session.failure_message == "Unsupported video format");
}

void TestProcessingTimeout() {
  Harness h;
  h.options.max_processing_wait = seconds(600);
  const auto in_progress        = Reply(200, R"({"processing_info":{"state":"in_progress","check_after_secs":200}})");
  h.http->handler = Script(R"({"processing_info":{"state":"pending","check_after_secs":200}})", {in_progress, in_progress, in_progress});

  auto result = h.Uploader().Upload(Bytes("abc"), Video());
  assert(result.session.failure_reason == FailureReason::kProcessingTimeout);
  assert(result.session.failed_in == UploadState::kProcessing);
  assert(h.http->CountCommand("STATUS") == 3);
  assert(h.sleeper->Total() == seconds(600));
}

void TestDefaultStatusIntervalWhenServerGivesNone() {
  Harness h;
  h.http->handler = Script(R"({"processing_info":{"state":"pending"}})", {Reply(200, R"({"processing_info":{"state":"succeeded"}})")});

  auto result = h.Uploader().Upload(Bytes("abc"), Video());
  assert(result.Succeeded());
  assert(h.sleeper->sleeps.size() == 1);
  assert(h.sleeper->sleeps[0] == seconds(5));
}

void TestStatusErrorsAreRejections() {
  {
    Harness h;
    h.http->handler = Script(R"({"processing_info":{"state":"pending","check_after_secs":1}})", {Reply(500, "boom")});
    auto result     = h.Uploader().Upload(Bytes("abc"), Video());
    assert(result.session.failure_reason == FailureReason::kStatusRejected);
    assert(h.http->CountCommand("STATUS") == 1);
  }
  {
    Harness h;
    h.http->handler = Script(R"({"processing_info":{"state":"pending","check_after_secs":1}})",
                             {Reply(200, R"({"processing_info":{"state":"exploded"}})")});
    auto result     = h.Uploader().Upload(Bytes("abc"), Video());
    assert(result.session.failure_reason == FailureReason::kStatusRejected);
  }
}

void TestUploadOrThrowCarriesReason() {
  Harness h;
  h.http->Enqueue(Reply(403, "forbidden"));

  bool threw = false;
  try {
    (void)h.Uploader().UploadOrThrow(Bytes("abc"), Video());
  } catch (const twiper::upload::UploadError& e) {
    threw = e.Reason() == FailureReason::kInitRejected && std::string(e.what()).rfind("init-rejected", 0) == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPendingThenSucceeded();
  TestFinalizeWithoutProcessingInfoSucceeds();
  TestTransientAppendIsRetriedWithBackoff();
  TestAppendExhaustion();
  TestClientErrorOnAppendIsNotRetried();
  TestInitRejectionIsNeverRetried();
  TestEmptyPayloadFailsWithoutNetwork();
  TestFinalizeRejected();
  TestProcessingFailureCarriesRemoteMessage();
  TestProcessingTimeout();
  TestDefaultStatusIntervalWhenServerGivesNone();
  TestStatusErrorsAreRejections();
  TestUploadOrThrowCarriesReason();

  std::cout << "twiper_unit_chunked_uploader: pass\n";
  return 0;
}
