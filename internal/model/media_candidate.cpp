#include "media_candidate.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace twiper::model {

const char* SourceKindName(SourceKind kind) {
  switch (kind) {
    case SourceKind::kLocal:
      return "LOCAL";
    case SourceKind::kCloudDrive:
      return "GDRIVE";
    case SourceKind::kAccountStorage:
      return "OBJECT";
  }
  return "LOCAL";
}

std::optional<std::string> MediaTypeForName(const std::string& name) {
  static const std::unordered_map<std::string, std::string> kByExtension = {
      {".mp4", "video/mp4"},   {".m4v", "video/mp4"},   {".mov", "video/quicktime"}, {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"}, {".png", "image/png"},   {".gif", "image/gif"},       {".webp", "image/webp"},
  };

  auto extension = std::filesystem::path(name).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = kByExtension.find(extension);
  if (it == kByExtension.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<MimeCategory> CategoryForMediaType(const std::string& media_type) {
  if (media_type.rfind("video/", 0) == 0) return MimeCategory::kVideo;
  if (media_type.rfind("image/", 0) == 0) return MimeCategory::kImage;
  return std::nullopt;
}

std::string UploadCategory(const MediaCandidate& candidate) {
  if (candidate.mime_category == MimeCategory::kVideo) {
    return "tweet_video";
  }
  if (candidate.media_type == "image/gif") {
    return "tweet_gif";
  }
  return "tweet_image";
}

} // namespace twiper::model
