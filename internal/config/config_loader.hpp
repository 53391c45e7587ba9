#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace twiper::config {

inline constexpr std::uint64_t kDefaultChunkSizeBytes = 1ull * 1024 * 1024;
// Hard upper bound enforced by the media upload endpoint.
inline constexpr std::uint64_t kMaxChunkSizeBytes = 5ull * 1024 * 1024;

/*
  Loads RuntimeConfig.

  Order of precedence (last wins):
    1. defaults
    2. YAML file named by TWIPER_CONFIG (optional)
    3. environment variables (aliases accepted, first non-empty wins)

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

  static twiper::runtime::config::RuntimeConfig Load(const EnvLookup& env);
  static twiper::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyEnvironment(twiper::runtime::config::RuntimeConfig* config, const EnvLookup& env);
  static void ApplyDefaults(twiper::runtime::config::RuntimeConfig* config);

  // Throws util::ConfigurationError naming every missing/invalid setting.
  static void Validate(const twiper::runtime::config::RuntimeConfig& config);

  static EnvLookup ProcessEnvironment();
};

} // namespace twiper::config
