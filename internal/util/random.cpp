#include "random.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace twiper::util {

Token128 GenerateToken() {
  Token128 token{};
  if (RAND_bytes(token.data(), static_cast<int>(token.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return token;
}

std::string ToHex(const Token128& token) {
  std::ostringstream oss;
  for (auto b : token) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return oss.str();
}

double UniformUnit() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

} // namespace twiper::util
