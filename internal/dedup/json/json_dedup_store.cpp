#include "json_dedup_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <google/protobuf/struct.pb.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <exception>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace twiper::dedup::json {

namespace {

template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& what) {
  if (!result.ok()) throw util::StoreError(what + ": " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

void Check(const arrow::Status& status, const std::string& what) {
  if (!status.ok()) throw util::StoreError(what + ": " + status.ToString());
}

// Largest magnitude at which every integer is exactly representable as a double.
constexpr double kMaxExactInteger = 9007199254740992.0;

bool IsExactInteger(double value) {
  return std::isfinite(value) && std::trunc(value) == value && std::fabs(value) <= kMaxExactInteger;
}

// Makes a completed rename durable.
void SyncDirectory(const std::filesystem::path& dir) {
  const std::string name = dir.empty() ? std::string(".") : dir.string();
  int               fd   = ::open(name.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    throw util::StoreError("open " + name + ": " + std::strerror(errno));
  }
  if (::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    throw util::StoreError("fsync " + name + ": " + std::strerror(err));
  }
  ::close(fd);
}

} // namespace

JsonDedupStore::JsonDedupStore(std::filesystem::path path) : path_(std::move(path)) {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) throw util::StoreError("cannot create " + path_.parent_path().string() + ": " + ec.message());
  }
  Load();
}

void JsonDedupStore::Load() {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    return;
  }

  auto file   = Unwrap(arrow::io::ReadableFile::Open(path_.string()), "open " + path_.string());
  auto size   = Unwrap(file->GetSize(), "stat " + path_.string());
  auto buffer = Unwrap(file->Read(size), "read " + path_.string());
  Check(file->Close(), "close " + path_.string());

  std::string text = buffer->ToString();
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return;
  }

  google::protobuf::ListValue list;
  std::string                 error;
  if (!util::ParseJson(text, &list, &error)) {
    throw util::StoreError("malformed " + path_.string() + ": " + error);
  }

  for (const auto& value : list.values()) {
    switch (value.kind_case()) {
      case google::protobuf::Value::kStringValue:
        if (!value.string_value().empty()) names_.insert(value.string_value());
        break;
      case google::protobuf::Value::kNumberValue:
        // bare integers were written by older tools; anything else is not a name
        if (IsExactInteger(value.number_value())) {
          names_.insert(std::to_string(static_cast<long long>(value.number_value())));
        }
        break;
      default:
        break;
    }
  }
}

std::vector<std::string> JsonDedupStore::ListSeen() {
  return {names_.begin(), names_.end()};
}

Result JsonDedupStore::RecordPosted(const PostedRecord& record) {
  const auto& name = record.key.name;
  if (name.empty() || names_.count(name) > 0) {
    return Result::Ok();
  }

  names_.insert(name);
  try {
    Persist();
  } catch (const std::exception& e) {
    names_.erase(name);
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Ok();
}

void JsonDedupStore::Persist() const {
  google::protobuf::ListValue list;
  for (const auto& name : names_) {
    list.add_values()->set_string_value(name);
  }
  std::string text = util::ToJson(list, /*pretty=*/true);
  text += '\n';

  auto tmp_path = path_;
  tmp_path += ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()), "open " + tmp_path.string());
    Check(out->Write(text.data(), static_cast<int64_t>(text.size())), "write " + tmp_path.string());
    Check(out->Flush(), "flush " + tmp_path.string());
    if (::fsync(out->file_descriptor()) != 0) {
      throw util::StoreError("fsync " + tmp_path.string() + ": " + std::strerror(errno));
    }
    Check(out->Close(), "close " + tmp_path.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    throw util::StoreError("rename " + tmp_path.string() + ": " + ec.message());
  }
  SyncDirectory(path_.parent_path());
}

} // namespace twiper::dedup::json
