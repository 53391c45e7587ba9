#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace twiper::model {

enum class SourceKind : std::uint8_t {
  kLocal          = 0,
  kCloudDrive     = 1,
  kAccountStorage = 2,
};

enum class MimeCategory : std::uint8_t {
  kVideo = 0,
  kImage = 1,
};

/*
  A postable item discovered in a source. Never mutated after listing.

  `handle` is the backend's stable id (path, Drive file id, object path).
  `name` is the file name and doubles as the dedup key for name-only stores.
*/
struct MediaCandidate {
  SourceKind      source_kind   = SourceKind::kLocal;
  std::string     handle;
  std::string     name;
  std::uint64_t   size_bytes    = 0;
  MimeCategory    mime_category = MimeCategory::kImage;
  std::string     media_type;  // e.g. "video/mp4"
  util::TimePoint modified_at{};
};

/*
  Local copy of a candidate's bytes.

  `temporary` is set when the source created the file (remote download) and
  owns its removal during cleanup.
*/
struct DownloadedMedia {
  std::filesystem::path          local_path;
  std::shared_ptr<arrow::Buffer> bytes;
  bool                           temporary = false;
};

// Stable column value used by the relational dedup store: LOCAL, GDRIVE, OBJECT.
const char* SourceKindName(SourceKind kind);

// MIME type from a file name extension; nullopt for non-media files.
std::optional<std::string> MediaTypeForName(const std::string& name);

// Video for video/*, Image for image/*; nullopt otherwise.
std::optional<MimeCategory> CategoryForMediaType(const std::string& media_type);

// Upload media_category: tweet_video, tweet_gif or tweet_image.
std::string UploadCategory(const MediaCandidate& candidate);

} // namespace twiper::model
