#include "drive_source.hpp"

#include <cctype>
#include <deque>
#include <stdexcept>
#include <unordered_set>

#include "internal/http/url.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "twiper/api/v1/drive.pb.h"

namespace twiper::source::drive {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kListFields     = "nextPageToken, files(id, name, mimeType, parents, createdTime, modifiedTime, size)";
constexpr const char* kMetadataFields = "id, name, mimeType, parents, createdTime, modifiedTime, size";
constexpr const char* kPageSize       = "1000";

bool IsIdChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::string TakeId(const std::string& text, std::size_t begin) {
  std::size_t end = begin;
  while (end < text.size() && IsIdChar(text[end])) ++end;
  return text.substr(begin, end - begin);
}

// Drive query string literal: backslash and quote are escaped.
std::string QuoteLiteral(const std::string& value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\\' || c == '\'') out += '\\';
    out += c;
  }
  return out + "'";
}

std::optional<model::MediaCandidate> ToCandidate(const api::v1::DriveFile& file) {
  auto category = model::CategoryForMediaType(file.mime_type());
  if (!category || file.id().empty()) return std::nullopt;

  model::MediaCandidate candidate;
  candidate.source_kind   = model::SourceKind::kCloudDrive;
  candidate.handle        = file.id();
  candidate.name          = file.name().empty() ? file.id() : file.name();
  candidate.size_bytes    = file.size() > 0 ? static_cast<std::uint64_t>(file.size()) : 0;
  candidate.mime_category = *category;
  candidate.media_type    = file.mime_type();

  if (file.has_modified_time()) {
    candidate.modified_at = util::FromProto(file.modified_time());
  } else if (file.has_created_time()) {
    candidate.modified_at = util::FromProto(file.created_time());
  }
  return candidate;
}

template <typename Message>
Message ParseOrThrow(const http::HttpResponse& response, const char* what) {
  Message     message;
  std::string error;
  if (!util::ParseJson(response.body, &message, &error)) {
    throw util::SourceError(std::string("malformed drive response for ") + what + ": " + error);
  }
  return message;
}

} // namespace

DriveSource::DriveSource(DriveSourceOptions options, http::HttpClientPtr http, AccessTokenProviderPtr tokens)
    : options_(std::move(options)), http_(std::move(http)), tokens_(std::move(tokens)) {
  if (!http_ || !tokens_) {
    throw std::invalid_argument("DriveSource requires http client and token provider");
  }
  if (!options_.public_url.empty() && !ExtractFileId(options_.public_url)) {
    throw util::ConfigurationError("cannot extract a Drive file id from " + options_.public_url);
  }
  if (options_.public_url.empty() && options_.folder_id.empty() && options_.folder_name.empty()) {
    throw util::ConfigurationError("drive source needs folder_id, folder_name or public_url");
  }
}

std::optional<std::string> DriveSource::ExtractFileId(const std::string& url) {
  auto pos = url.find("/d/");
  if (pos != std::string::npos) {
    auto id = TakeId(url, pos + 3);
    if (!id.empty()) return id;
  }

  for (const char* marker : {"?id=", "&id="}) {
    pos = url.find(marker);
    if (pos != std::string::npos) {
      auto id = TakeId(url, pos + 4);
      if (!id.empty()) return id;
    }
  }
  return std::nullopt;
}

std::string DriveSource::FilesUrl(const std::string& file_id) const {
  auto url = options_.api_base_url;
  while (!url.empty() && url.back() == '/') url.pop_back();
  url += "/drive/v3/files";
  if (!file_id.empty()) url += "/" + http::PercentEncode(file_id);
  return url;
}

void DriveSource::AddDriveParams(http::Params* query, bool listing) const {
  if (options_.drive_id.empty()) {
    if (listing) query->emplace_back("corpora", "user");
    return;
  }
  query->emplace_back("supportsAllDrives", "true");
  if (listing) {
    query->emplace_back("includeItemsFromAllDrives", "true");
    query->emplace_back("driveId", options_.drive_id);
    query->emplace_back("corpora", "drive");
  }
}

http::HttpResponse DriveSource::Call(http::HttpRequest request, const char* what) {
  request.headers.emplace_back("Authorization", "Bearer " + tokens_->AccessToken());
  auto response = http_->Send(request);
  if (!response.Ok()) {
    throw util::SourceError(std::string("drive ") + what + " failed: " + http::Describe(response));
  }
  return response;
}

std::string DriveSource::ResolveFolderId() {
  if (!options_.folder_id.empty()) {
    return options_.folder_id;
  }

  http::HttpRequest request;
  request.url   = FilesUrl();
  request.query = {
      {"q", "name = " + QuoteLiteral(options_.folder_name) + " and mimeType = '" + kFolderMimeType + "' and trashed = false"},
      {"pageSize", "1"},
      {"fields", "files(id, name)"},
  };
  AddDriveParams(&request.query, /*listing=*/true);

  auto list = ParseOrThrow<api::v1::DriveFileList>(Call(std::move(request), "folder lookup"), "folder lookup");
  if (list.files().empty()) {
    throw util::SourceError("drive folder '" + options_.folder_name + "' not found");
  }

  options_.folder_id = list.files(0).id();
  TWIPER_LOG_INFO("drive folder resolved", {StringField("folder", options_.folder_name), StringField("folder_id", options_.folder_id)});
  return options_.folder_id;
}

std::vector<api::v1::DriveFile> DriveSource::ListChildren(const std::string& parent_id) {
  std::vector<api::v1::DriveFile> files;
  std::string                     page_token;

  do {
    http::HttpRequest request;
    request.url   = FilesUrl();
    request.query = {
        {"q", QuoteLiteral(parent_id) + " in parents and trashed = false"},
        {"fields", kListFields},
        {"pageSize", kPageSize},
    };
    AddDriveParams(&request.query, /*listing=*/true);
    if (!page_token.empty()) request.query.emplace_back("pageToken", page_token);

    auto page = ParseOrThrow<api::v1::DriveFileList>(Call(std::move(request), "list"), "list");
    for (auto& file : *page.mutable_files()) {
      files.push_back(std::move(file));
    }
    page_token = page.next_page_token();
  } while (!page_token.empty());

  return files;
}

std::vector<model::MediaCandidate> DriveSource::ListFolderTree() {
  std::vector<model::MediaCandidate> candidates;
  std::deque<std::string>            queue{ResolveFolderId()};
  std::unordered_set<std::string>    visited;

  while (!queue.empty()) {
    auto parent = std::move(queue.front());
    queue.pop_front();
    if (!visited.insert(parent).second) continue;

    for (const auto& file : ListChildren(parent)) {
      if (file.mime_type() == kFolderMimeType) {
        queue.push_back(file.id());
        continue;
      }
      if (auto candidate = ToCandidate(file)) {
        candidates.push_back(std::move(*candidate));
      }
    }
  }

  TWIPER_LOG_DEBUG("drive listing complete",
                   {IntField("folders", static_cast<std::int64_t>(visited.size())), IntField("media", static_cast<std::int64_t>(candidates.size()))});
  return candidates;
}

model::MediaCandidate DriveSource::SharedLinkCandidate() {
  if (shared_candidate_) return *shared_candidate_;

  const auto file_id = *ExtractFileId(options_.public_url);

  http::HttpRequest request;
  request.url   = FilesUrl(file_id);
  request.query = {{"fields", kMetadataFields}};
  AddDriveParams(&request.query, /*listing=*/false);

  auto file      = ParseOrThrow<api::v1::DriveFile>(Call(std::move(request), "metadata"), "metadata");
  auto candidate = ToCandidate(file);
  if (!candidate) {
    throw util::SourceError("shared Drive file " + file_id + " is not a video or image (" + file.mime_type() + ")");
  }

  shared_candidate_ = std::move(*candidate);
  return *shared_candidate_;
}

std::vector<model::MediaCandidate> DriveSource::ListCandidates() {
  if (!CanEnumerate()) {
    return {SharedLinkCandidate()};
  }
  return ListFolderTree();
}

model::DownloadedMedia DriveSource::Download(const model::MediaCandidate& candidate) {
  http::HttpRequest request;
  request.url   = FilesUrl(candidate.handle);
  request.query = {{"alt", "media"}};
  AddDriveParams(&request.query, /*listing=*/false);

  auto response = Call(std::move(request), "download");

  model::DownloadedMedia media;
  media.bytes      = arrow::Buffer::FromString(std::move(response.body));
  media.local_path = options_.work_dir / candidate.name;
  media.temporary  = true;
  common::WriteLocalFile(media.local_path, media.bytes);

  TWIPER_LOG_DEBUG("drive file downloaded",
                   {StringField("file_id", candidate.handle), IntField("bytes", media.bytes->size()),
                    StringField("path", media.local_path.string())});
  return media;
}

void DriveSource::Cleanup(const model::MediaCandidate& candidate, const std::filesystem::path& local_path) {
  if (CanEnumerate()) {
    http::HttpRequest request;
    request.url = FilesUrl(candidate.handle);
    AddDriveParams(&request.query, /*listing=*/false);

    if (options_.hard_delete) {
      request.method = http::Method::kDelete;
      Call(std::move(request), "delete");
      TWIPER_LOG_INFO("deleted drive file", {StringField("file_id", candidate.handle), StringField("name", candidate.name)});
    } else {
      request.method    = http::Method::kPatch;
      request.body_kind = http::BodyKind::kJson;
      request.body      = R"({"trashed":true})";
      Call(std::move(request), "trash");
      TWIPER_LOG_INFO("moved drive file to trash", {StringField("file_id", candidate.handle), StringField("name", candidate.name)});
    }
  }

  if (!local_path.empty()) {
    common::RemoveLocalFile(local_path);
  }
}

} // namespace twiper::source::drive
