#pragma once

#include <arrow/filesystem/filesystem.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/source/source_adapter.hpp"

namespace twiper::source {

/*
  Shared listing and reading over an Arrow filesystem.

  Lists recursively below `root`, keeping regular files with a known media
  extension. The candidate handle is the path inside the filesystem.
*/
class FileSystemSource : public SourceAdapter {
 public:
  FileSystemSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root);

  bool CanEnumerate() const override {
    return true;
  }

  std::vector<model::MediaCandidate> ListCandidates() override;

 protected:
  std::shared_ptr<arrow::Buffer> ReadRemote(const model::MediaCandidate& candidate) const;

  // Subtrees skipped while listing, relative to root.
  virtual bool SkipPath(const std::string& path) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
};

/*
  Folder on the local disk. Files are read in place and deleted after a
  successful post only when `delete_after_post` is set.
*/
class LocalFolderSource final : public FileSystemSource {
 public:
  LocalFolderSource(const std::filesystem::path& root, bool delete_after_post);

  model::SourceKind Kind() const override {
    return model::SourceKind::kLocal;
  }

  model::DownloadedMedia Download(const model::MediaCandidate& candidate) override;

  void Cleanup(const model::MediaCandidate& candidate, const std::filesystem::path& local_path) override;

 private:
  bool delete_after_post_;
};

/*
  Account storage reached through an Arrow filesystem URI.

  Objects are downloaded into `work_dir`. After a post the object is
  deleted (`hard_delete`) or moved to <root>/.posted/, and the local copy
  is removed.
*/
class ObjectStoreSource final : public FileSystemSource {
 public:
  static constexpr const char* kPostedDir = ".posted";

  ObjectStoreSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root, std::filesystem::path work_dir, bool hard_delete);

  // Resolves `uri` (s3://bucket/prefix, gs://..., file:///...) through Arrow.
  static std::shared_ptr<ObjectStoreSource> FromUri(const std::string& uri, std::filesystem::path work_dir, bool hard_delete);

  model::SourceKind Kind() const override {
    return model::SourceKind::kAccountStorage;
  }

  model::DownloadedMedia Download(const model::MediaCandidate& candidate) override;

  void Cleanup(const model::MediaCandidate& candidate, const std::filesystem::path& local_path) override;

 protected:
  bool SkipPath(const std::string& path) const override;

 private:
  std::string PostedDir() const;

  std::filesystem::path work_dir_;
  bool                  hard_delete_;
};

} // namespace twiper::source
