#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace twiper::util {

/*
  Random helpers backed by the OpenSSL CSPRNG.
*/

using Token128 = std::array<std::uint8_t, 16>;

Token128 GenerateToken();

std::string ToHex(const Token128& token);

// Uniform double in [0, 1); used for backoff jitter, not secrets.
double UniformUnit();

} // namespace twiper::util
