#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace twiper::caption {

class CaptionResolver {
 public:
  virtual ~CaptionResolver() = default;

  // Caption text for a downloaded media file; nullopt posts the media alone.
  virtual std::optional<std::string> Resolve(const std::filesystem::path& media_path) = 0;
};

using CaptionResolverPtr = std::shared_ptr<CaptionResolver>;

/*
  Caption from text files next to the media or in a caption directory.

  First existing wins:
    <media dir>/<stem>.txt
    <caption_dir>/<stem>.txt
    <caption_dir>/caption.txt
    first other *.txt in <caption_dir> (by name)

  Content is trimmed; a blank file counts as no caption.
*/
class LocalCaptionResolver final : public CaptionResolver {
 public:
  static constexpr const char* kDefaultCaptionFile = "caption.txt";

  explicit LocalCaptionResolver(std::filesystem::path caption_dir);

  std::optional<std::string> Resolve(const std::filesystem::path& media_path) override;

 private:
  std::optional<std::string> ReadCaption(const std::filesystem::path& path) const;

  std::filesystem::path caption_dir_;
};

} // namespace twiper::caption
