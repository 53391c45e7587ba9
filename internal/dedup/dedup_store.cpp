#include "dedup_store.hpp"

namespace twiper::dedup {

namespace {

// unit separator; never part of a file name or object path
constexpr char kKeySeparator = '\x1f';

} // namespace

std::string EncodeKey(KeyMode mode, const DedupKey& key) {
  if (mode == KeyMode::kNameOnly) {
    return key.name;
  }

  std::string encoded = model::SourceKindName(key.source_kind);
  encoded += kKeySeparator;
  encoded += key.handle;
  encoded += kKeySeparator;
  encoded += key.name;
  return encoded;
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace twiper::dedup
