#include "caption_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

#include "internal/observability/logging.hpp"

namespace twiper::caption {

using observability::StringField;

namespace {

std::string Trim(const std::string& text) {
  const char* ws    = " \t\r\n\f\v";
  const auto  begin = text.find_first_not_of(ws);
  if (begin == std::string::npos) return {};
  const auto end = text.find_last_not_of(ws);
  return text.substr(begin, end - begin + 1);
}

bool IsTextFile(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".txt";
}

} // namespace

LocalCaptionResolver::LocalCaptionResolver(std::filesystem::path caption_dir) : caption_dir_(std::move(caption_dir)) {
}

std::optional<std::string> LocalCaptionResolver::ReadCaption(const std::filesystem::path& path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    TWIPER_LOG_WARN("caption file unreadable", {StringField("path", path.string())});
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    TWIPER_LOG_WARN("caption file unreadable", {StringField("path", path.string())});
    return std::nullopt;
  }

  auto text = Trim(buffer.str());
  if (text.empty()) return std::nullopt;
  return text;
}

std::optional<std::string> LocalCaptionResolver::Resolve(const std::filesystem::path& media_path) {
  const auto stem_file = media_path.stem().string() + ".txt";

  std::vector<std::filesystem::path> ordered;
  if (media_path.has_parent_path()) ordered.push_back(media_path.parent_path() / stem_file);
  if (!caption_dir_.empty()) {
    ordered.push_back(caption_dir_ / stem_file);
    ordered.push_back(caption_dir_ / kDefaultCaptionFile);
  }

  for (const auto& path : ordered) {
    if (auto text = ReadCaption(path)) {
      TWIPER_LOG_DEBUG("caption resolved", {StringField("media", media_path.filename().string()), StringField("caption_file", path.string())});
      return text;
    }
  }

  if (caption_dir_.empty()) return std::nullopt;

  std::error_code                    ec;
  std::vector<std::filesystem::path> others;
  for (std::filesystem::directory_iterator it(caption_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && IsTextFile(it->path())) others.push_back(it->path());
  }
  std::sort(others.begin(), others.end());

  for (const auto& path : others) {
    if (auto text = ReadCaption(path)) return text;
  }
  return std::nullopt;
}

} // namespace twiper::caption
