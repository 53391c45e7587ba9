#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/http/http_client.hpp"
#include "internal/source/drive/access_token_provider.hpp"
#include "internal/source/source_adapter.hpp"

namespace twiper::api::v1 {
class DriveFile;
}

namespace twiper::source::drive {

struct DriveSourceOptions {
  std::string           api_base_url = "https://www.googleapis.com";
  std::string           folder_id;
  std::string           folder_name = "XYZBlob";
  std::string           drive_id;  // shared drive; empty for "My Drive"
  std::string           public_url;
  bool                  hard_delete = false;
  std::filesystem::path work_dir    = "data";
};

/*
  Drive v3 source.

  Folder mode walks the folder tree breadth-first (paged listing) and
  offers every video/* and image/* file. Posted files are trashed, or
  deleted when hard_delete is set.

  Shared-link mode (public_url) exposes the single linked file, cannot be
  enumerated and never touches the remote file on cleanup.
*/
class DriveSource final : public SourceAdapter {
 public:
  static constexpr const char* kFolderMimeType = "application/vnd.google-apps.folder";

  DriveSource(DriveSourceOptions options, http::HttpClientPtr http, AccessTokenProviderPtr tokens);

  model::SourceKind Kind() const override {
    return model::SourceKind::kCloudDrive;
  }

  bool CanEnumerate() const override {
    return options_.public_url.empty();
  }

  std::vector<model::MediaCandidate> ListCandidates() override;

  model::DownloadedMedia Download(const model::MediaCandidate& candidate) override;

  void Cleanup(const model::MediaCandidate& candidate, const std::filesystem::path& local_path) override;

  // File id from ".../d/<id>/..." or "...?id=<id>" links.
  static std::optional<std::string> ExtractFileId(const std::string& url);

 private:
  std::string ResolveFolderId();
  std::vector<api::v1::DriveFile> ListChildren(const std::string& parent_id);
  std::vector<model::MediaCandidate> ListFolderTree();
  model::MediaCandidate SharedLinkCandidate();

  http::HttpResponse Call(http::HttpRequest request, const char* what);
  void AddDriveParams(http::Params* query, bool listing) const;
  std::string FilesUrl(const std::string& file_id = {}) const;

  DriveSourceOptions     options_;
  http::HttpClientPtr    http_;
  AccessTokenProviderPtr tokens_;

  std::optional<model::MediaCandidate> shared_candidate_;
};

} // namespace twiper::source::drive
