#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using twiper::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "twiper_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

ConfigLoader::EnvLookup Env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) return std::nullopt;
    return it->second;
  };
}

std::map<std::string, std::string> Credentials() {
  return {
      {"X_API_KEY", "ck"},
      {"X_API_SECRET", "cs"},
      {"X_ACCESS_TOKEN", "at"},
      {"X_ACCESS_SECRET", "as"},
  };
}

template <typename Fn>
std::string ConfigErrorOf(Fn&& fn) {
  try {
    fn();
  } catch (const twiper::util::ConfigurationError& e) {
    return e.what();
  }
  return {};
}

void TestDefaultsWithCredentialsOnly() {
  auto config = ConfigLoader::Load(Env(Credentials()));

  assert(config.source().kind() == twiper::runtime::config::SOURCE_KIND_LOCAL);
  assert(config.source().local().root() == "data");
  assert(config.dedup().backend() == twiper::runtime::config::DEDUP_BACKEND_SQLITE);
  assert(config.dedup().sqlite_path() == "data/twiper.db");
  assert(config.upload().chunk_size_bytes() == twiper::config::kDefaultChunkSizeBytes);
  assert(config.upload().max_append_attempts() == 5);
  assert(config.upload().max_processing_wait_secs() == 600);
  assert(config.post().limit() == 0);
  assert(config.post().endpoint() == "https://api.twitter.com/2/tweets");
}

void TestCredentialAliasesFirstNonEmptyWins() {
  auto config = ConfigLoader::Load(Env({
      {"X_API_KEY", ""},
      {"TWITTER_API_KEY", "twitter-key"},
      {"CONSUMER_KEY", "consumer-key"},
      {"CONSUMER_SECRET", "secret"},
      {"TWITTER_ACCESS_TOKEN", "token"},
      {"TWITTER_ACCESS_SECRET", "token-secret"},
  }));

  assert(config.credentials().consumer_key() == "twitter-key");
  assert(config.credentials().consumer_secret() == "secret");
  assert(config.credentials().access_token() == "token");
  assert(config.credentials().access_secret() == "token-secret");
}

void TestMissingCredentialsAreNamed() {
  auto env = Credentials();
  env.erase("X_API_SECRET");
  env.erase("X_ACCESS_SECRET");

  auto message = ConfigErrorOf([&] { ConfigLoader::Load(Env(env)); });
  assert(message == "Missing OAuth credentials: API secret, Access secret");
}

void TestPostLimitMustBeNumeric() {
  auto env          = Credentials();
  env["POST_LIMIT"] = "3";
  assert(ConfigLoader::Load(Env(env)).post().limit() == 3);

  env["X_POST_LIMIT"] = "three";
  auto message        = ConfigErrorOf([&] { ConfigLoader::Load(Env(env)); });
  assert(message.find("post limit") != std::string::npos);
}

void TestSourceAndDedupSelection() {
  auto env                    = Credentials();
  env["TWIPER_SOURCE"]        = "object";
  env["OBJECT_STORE_URI"]     = "file:///tmp/twiper-media";
  env["OBJECT_STORE_HARD_DELETE"] = "yes";
  env["TWIPER_DEDUP_BACKEND"] = "json";
  env["POSTED_JSON_PATH"]     = "/tmp/posted.json";

  auto config = ConfigLoader::Load(Env(env));
  assert(config.source().kind() == twiper::runtime::config::SOURCE_KIND_OBJECT);
  assert(config.source().object().hard_delete());
  assert(config.source().caption_dir() == config.source().work_dir());
  assert(config.dedup().backend() == twiper::runtime::config::DEDUP_BACKEND_JSON);
  assert(config.dedup().json_path() == "/tmp/posted.json");

  env.erase("OBJECT_STORE_URI");
  assert(!ConfigErrorOf([&] { ConfigLoader::Load(Env(env)); }).empty());

  env["TWIPER_SOURCE"] = "ftp";
  assert(!ConfigErrorOf([&] { ConfigLoader::Load(Env(env)); }).empty());
}

void TestDriveRequiresServiceAccount() {
  auto env             = Credentials();
  env["TWIPER_SOURCE"] = "gdrive";
  assert(!ConfigErrorOf([&] { ConfigLoader::Load(Env(env)); }).empty());

  env["GDRIVE_SERVICE_ACCOUNT_FILE"] = "/etc/twiper/sa.json";
  env["GDRIVE_HARD_DELETE"]          = "TRUE";
  auto config                        = ConfigLoader::Load(Env(env));
  assert(config.source().drive().folder_name() == "XYZBlob");
  assert(config.source().drive().hard_delete());
}

void TestYamlThenEnvironmentOverride() {
  const auto yaml_path = WriteYaml("yaml_then_env", R"(credentials:
  consumer_key: "yaml-key"
  consumer_secret: "yaml-secret"
  access_token: "yaml-token"
  access_secret: "yaml-token-secret"
upload:
  chunk_size_bytes: 2097152
  max_append_attempts: 3
post:
  limit: 2
logging:
  level: "debug"
)");

  auto config = ConfigLoader::Load(Env({{"TWIPER_CONFIG", yaml_path.string()}, {"X_API_KEY", "env-key"}}));
  assert(config.credentials().consumer_key() == "env-key");
  assert(config.credentials().consumer_secret() == "yaml-secret");
  assert(config.upload().chunk_size_bytes() == 2097152);
  assert(config.upload().max_append_attempts() == 3);
  assert(config.post().limit() == 2);
  assert(config.logging().level() == "debug");
}

void TestChunkSizeUpperBound() {
  const auto yaml_path = WriteYaml("chunk_too_large", R"(upload:
  chunk_size_bytes: 6291456
)");

  auto env             = Credentials();
  env["TWIPER_CONFIG"] = yaml_path.string();
  auto message         = ConfigErrorOf([&] { ConfigLoader::Load(Env(env)); });
  assert(message.find("chunk_size_bytes") != std::string::npos);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(credentials:
  consumer_key: "k"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const twiper::util::ConfigurationError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(dedup:
  sqlite_path: "C:\\twiper\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.dedup().sqlite_path() == "C:\\twiper\\\"quoted\"\\db.sqlite");
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars", R"(source:
  local:
    root: "2024"
  drive:
    folder_id: "1234567890"
    folder_name: 'true'
post:
  limit: 7
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.source().local().root() == "2024");
  assert(config.source().drive().folder_id() == "1234567890");
  assert(config.source().drive().folder_name() == "true");
  assert(config.post().limit() == 7);
}

} // namespace

int main() {
  TestDefaultsWithCredentialsOnly();
  TestCredentialAliasesFirstNonEmptyWins();
  TestMissingCredentialsAreNamed();
  TestPostLimitMustBeNumeric();
  TestSourceAndDedupSelection();
  TestDriveRequiresServiceAccount();
  TestYamlThenEnvironmentOverride();
  TestChunkSizeUpperBound();
  TestUnknownFieldsAreRejected();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedScalarsStayStrings();

  std::cout << "twiper_unit_config_loader: pass\n";
  return 0;
}
