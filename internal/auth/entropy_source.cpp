#include "entropy_source.hpp"

#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace twiper::auth {

std::string SystemEntropySource::NextNonce() {
  return util::ToHex(util::GenerateToken());
}

std::int64_t SystemEntropySource::NowUnixSeconds() {
  return util::ToUnixSeconds(util::Now());
}

} // namespace twiper::auth
