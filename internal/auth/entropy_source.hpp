#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace twiper::auth {

/*
  Nonce and timestamp source for request signing.

  Injected so signatures are reproducible under test.
*/
class EntropySource {
 public:
  virtual ~EntropySource() = default;

  virtual std::string  NextNonce()      = 0;
  virtual std::int64_t NowUnixSeconds() = 0;
};

// 128-bit CSPRNG nonces (hex) and the system clock.
class SystemEntropySource final : public EntropySource {
 public:
  std::string  NextNonce() override;
  std::int64_t NowUnixSeconds() override;
};

using EntropySourcePtr = std::shared_ptr<EntropySource>;

} // namespace twiper::auth
