#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace twiper::source::common {

/*
  Helper: unwrap Arrow Result<T> or throw SourceError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::SourceError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::SourceError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Filesystem for a URI or plain local path, plus the path inside it.
*/
std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string> ResolveFileSystem(const std::string& uri_or_path);

/*
  Atomic local write:
      write tmp -> flush -> rename
*/
void WriteLocalFile(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer);

// Removes a local file, ignoring "not found". Throws SourceError on other failures.
void RemoveLocalFile(const std::filesystem::path& path);

util::TimePoint ToTimePoint(arrow::fs::TimePoint mtime);

} // namespace twiper::source::common
