#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/io/file.h>

namespace twiper::source::common {

std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string> ResolveFileSystem(const std::string& uri_or_path) {
  if (uri_or_path.empty()) {
    throw util::ConfigurationError("empty filesystem location");
  }

  std::string resolved_path;
  auto        result = arrow::fs::FileSystemFromUriOrPath(uri_or_path, &resolved_path);
  if (!result.ok()) {
    throw util::ConfigurationError("cannot resolve filesystem for '" + uri_or_path + "': " + result.status().ToString());
  }
  return {std::move(result).ValueUnsafe(), resolved_path};
}

void WriteLocalFile(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) throw util::SourceError("cannot create " + path.parent_path().string() + ": " + ec.message());
  }

  auto tmp_path = path;
  tmp_path += ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) throw util::SourceError("rename " + tmp_path.string() + ": " + ec.message());
}

void RemoveLocalFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) throw util::SourceError("cannot remove " + path.string() + ": " + ec.message());
}

util::TimePoint ToTimePoint(arrow::fs::TimePoint mtime) {
  if (mtime == arrow::fs::kNoTime) return util::TimePoint{};
  return std::chrono::time_point_cast<util::Clock::duration>(mtime);
}

} // namespace twiper::source::common
