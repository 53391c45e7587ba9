#include "filesystem_source.hpp"

#include <arrow/filesystem/localfs.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/source/common/arrow_utils.hpp"

namespace twiper::source {

using namespace twiper::source::common;
using observability::StringField;

namespace {

std::string JoinPath(const std::string& base, const std::string& child) {
  if (base.empty()) return child;
  if (base.back() == '/') return base + child;
  return base + "/" + child;
}

} // namespace

FileSystemSource::FileSystemSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root)
    : fs_(std::move(fs)), root_(std::move(root)) {
  if (!fs_) {
    throw std::invalid_argument("FileSystemSource requires a filesystem");
  }
}

bool FileSystemSource::SkipPath(const std::string&) const {
  return false;
}

std::vector<model::MediaCandidate> FileSystemSource::ListCandidates() {
  arrow::fs::FileSelector selector;
  selector.base_dir        = root_;
  selector.recursive       = true;
  selector.allow_not_found = false;

  auto infos = fs_->GetFileInfo(selector);
  if (!infos.ok()) {
    throw util::SourceError("cannot list " + root_ + ": " + infos.status().ToString());
  }

  std::vector<model::MediaCandidate> candidates;
  for (const auto& info : *infos) {
    if (info.type() != arrow::fs::FileType::File || SkipPath(info.path())) continue;

    auto media_type = model::MediaTypeForName(info.base_name());
    if (!media_type) continue;

    model::MediaCandidate candidate;
    candidate.source_kind   = Kind();
    candidate.handle        = info.path();
    candidate.name          = info.base_name();
    candidate.size_bytes    = info.size() > 0 ? static_cast<std::uint64_t>(info.size()) : 0;
    candidate.media_type    = *media_type;
    candidate.mime_category = model::CategoryForMediaType(*media_type).value_or(model::MimeCategory::kImage);
    candidate.modified_at   = ToTimePoint(info.mtime());
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

std::shared_ptr<arrow::Buffer> FileSystemSource::ReadRemote(const model::MediaCandidate& candidate) const {
  auto input = fs_->OpenInputFile(candidate.handle);
  if (!input.ok()) {
    throw util::SourceError("cannot open " + candidate.handle + ": " + input.status().ToString());
  }
  return ReadAll(*input);
}

// ------------------------------------------------------------------
// Local folder
// ------------------------------------------------------------------

LocalFolderSource::LocalFolderSource(const std::filesystem::path& root, bool delete_after_post)
    : FileSystemSource(std::make_shared<arrow::fs::LocalFileSystem>(), std::filesystem::absolute(root).lexically_normal().generic_string()),
      delete_after_post_(delete_after_post) {
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) throw util::SourceError("cannot create " + root.string() + ": " + ec.message());
}

model::DownloadedMedia LocalFolderSource::Download(const model::MediaCandidate& candidate) {
  model::DownloadedMedia media;
  media.local_path = candidate.handle;
  media.bytes      = ReadRemote(candidate);
  media.temporary  = false;
  return media;
}

void LocalFolderSource::Cleanup(const model::MediaCandidate& candidate, const std::filesystem::path&) {
  if (!delete_after_post_) return;

  Unwrap(fs_->DeleteFile(candidate.handle));
  TWIPER_LOG_INFO("deleted posted file", {StringField("path", candidate.handle)});
}

// ------------------------------------------------------------------
// Object store
// ------------------------------------------------------------------

ObjectStoreSource::ObjectStoreSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root, std::filesystem::path work_dir,
                                     bool hard_delete)
    : FileSystemSource(std::move(fs), std::move(root)), work_dir_(std::move(work_dir)), hard_delete_(hard_delete) {
}

std::shared_ptr<ObjectStoreSource> ObjectStoreSource::FromUri(const std::string& uri, std::filesystem::path work_dir, bool hard_delete) {
  auto [fs, root] = ResolveFileSystem(uri);
  return std::make_shared<ObjectStoreSource>(std::move(fs), std::move(root), std::move(work_dir), hard_delete);
}

std::string ObjectStoreSource::PostedDir() const {
  return JoinPath(root_, kPostedDir);
}

bool ObjectStoreSource::SkipPath(const std::string& path) const {
  const auto posted = PostedDir() + "/";
  return path.compare(0, posted.size(), posted) == 0;
}

model::DownloadedMedia ObjectStoreSource::Download(const model::MediaCandidate& candidate) {
  model::DownloadedMedia media;
  media.bytes      = ReadRemote(candidate);
  media.local_path = work_dir_ / candidate.name;
  media.temporary  = true;
  WriteLocalFile(media.local_path, media.bytes);
  return media;
}

void ObjectStoreSource::Cleanup(const model::MediaCandidate& candidate, const std::filesystem::path& local_path) {
  if (hard_delete_) {
    Unwrap(fs_->DeleteFile(candidate.handle));
    TWIPER_LOG_INFO("deleted posted object", {StringField("path", candidate.handle)});
  } else {
    Unwrap(fs_->CreateDir(PostedDir(), /*recursive=*/true));
    const auto target = JoinPath(PostedDir(), candidate.name);
    Unwrap(fs_->Move(candidate.handle, target));
    TWIPER_LOG_INFO("archived posted object", {StringField("path", candidate.handle), StringField("target", target)});
  }

  if (!local_path.empty()) {
    RemoveLocalFile(local_path);
  }
}

} // namespace twiper::source
