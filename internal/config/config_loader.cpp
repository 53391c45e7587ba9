#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"

namespace twiper::config {

using twiper::runtime::config::DedupBackend;
using twiper::runtime::config::RuntimeConfig;
using twiper::runtime::config::SourceKind;
using twiper::util::ConfigurationError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the "!" tag and always stay strings
  if (node.Tag() != "?") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigurationError("Unsupported YAML node");
  }
}

namespace {

std::optional<std::string> FirstEnv(const ConfigLoader::EnvLookup& env, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    auto value = env(name);
    if (value && !value->empty()) {
      return value;
    }
  }
  return std::nullopt;
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string& value) {
  const auto lowered = Lower(value);
  return lowered == "1" || lowered == "true" || lowered == "yes";
}

std::uint32_t ParseCount(const std::string& name, const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw ConfigurationError(name + " must be a non-negative integer, got '" + value + "'");
  }
  try {
    return static_cast<std::uint32_t>(std::stoul(value));
  } catch (const std::exception&) {
    throw ConfigurationError(name + " is out of range: '" + value + "'");
  }
}

SourceKind ParseSourceKind(const std::string& value) {
  const auto lowered = Lower(value);
  if (lowered == "local") return twiper::runtime::config::SOURCE_KIND_LOCAL;
  if (lowered == "gdrive" || lowered == "drive") return twiper::runtime::config::SOURCE_KIND_GDRIVE;
  if (lowered == "object" || lowered == "s3" || lowered == "gcs") return twiper::runtime::config::SOURCE_KIND_OBJECT;
  throw ConfigurationError("TWIPER_SOURCE must be one of local, gdrive, object; got '" + value + "'");
}

DedupBackend ParseDedupBackend(const std::string& value) {
  const auto lowered = Lower(value);
  if (lowered == "sqlite") return twiper::runtime::config::DEDUP_BACKEND_SQLITE;
  if (lowered == "json") return twiper::runtime::config::DEDUP_BACKEND_JSON;
  throw ConfigurationError("TWIPER_DEDUP_BACKEND must be sqlite or json; got '" + value + "'");
}

template <typename T>
void SetIfEmpty(T* current, const T& fallback) {
  if (*current == T{}) {
    *current = fallback;
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + status.ToString());
  }

  return config;
}

RuntimeConfig ConfigLoader::Load(const EnvLookup& env) {
  RuntimeConfig config;
  if (auto path = FirstEnv(env, {"TWIPER_CONFIG"})) {
    config = LoadFromYaml(*path);
  }
  ApplyEnvironment(&config, env);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig* config, const EnvLookup& env) {
  auto* credentials = config->mutable_credentials();
  if (auto v = FirstEnv(env, {"X_API_KEY", "TWITTER_API_KEY", "CONSUMER_KEY"})) credentials->set_consumer_key(*v);
  if (auto v = FirstEnv(env, {"X_API_SECRET", "TWITTER_API_SECRET", "CONSUMER_SECRET"})) credentials->set_consumer_secret(*v);
  if (auto v = FirstEnv(env, {"X_ACCESS_TOKEN", "TWITTER_ACCESS_TOKEN"})) credentials->set_access_token(*v);
  if (auto v = FirstEnv(env, {"X_ACCESS_SECRET", "TWITTER_ACCESS_SECRET"})) credentials->set_access_secret(*v);

  if (auto v = FirstEnv(env, {"X_POST_LIMIT", "POST_LIMIT"})) {
    config->mutable_post()->set_limit(ParseCount("post limit", *v));
  }

  auto* source = config->mutable_source();
  if (auto v = FirstEnv(env, {"TWIPER_SOURCE"})) source->set_kind(ParseSourceKind(*v));
  if (auto v = FirstEnv(env, {"TWIPER_DATA_DIR"})) source->mutable_local()->set_root(*v);
  if (auto v = FirstEnv(env, {"TWIPER_WORK_DIR"})) source->set_work_dir(*v);
  if (auto v = FirstEnv(env, {"TWIPER_CAPTION_DIR"})) source->set_caption_dir(*v);

  auto* drive = source->mutable_drive();
  if (auto v = FirstEnv(env, {"GDRIVE_FOLDER_ID"})) drive->set_folder_id(*v);
  if (auto v = FirstEnv(env, {"GDRIVE_DIR_NAME"})) drive->set_folder_name(*v);
  if (auto v = FirstEnv(env, {"GDRIVE_DRIVE_ID"})) drive->set_drive_id(*v);
  if (auto v = FirstEnv(env, {"GDRIVE_SERVICE_ACCOUNT_JSON"})) drive->set_service_account_json(*v);
  if (auto v = FirstEnv(env, {"GDRIVE_SERVICE_ACCOUNT_FILE"})) drive->set_service_account_file(*v);
  if (auto v = FirstEnv(env, {"GDRIVE_PUBLIC_URL"})) drive->set_public_url(*v);
  if (auto v = FirstEnv(env, {"GDRIVE_HARD_DELETE"})) drive->set_hard_delete(ParseBool(*v));

  auto* object = source->mutable_object();
  if (auto v = FirstEnv(env, {"OBJECT_STORE_URI"})) object->set_uri(*v);
  if (auto v = FirstEnv(env, {"OBJECT_STORE_HARD_DELETE"})) object->set_hard_delete(ParseBool(*v));

  auto* dedup = config->mutable_dedup();
  if (auto v = FirstEnv(env, {"TWIPER_DEDUP_BACKEND"})) dedup->set_backend(ParseDedupBackend(*v));
  if (auto v = FirstEnv(env, {"DB_PATH"})) dedup->set_sqlite_path(*v);
  if (auto v = FirstEnv(env, {"POSTED_JSON_PATH"})) dedup->set_json_path(*v);

  if (auto v = FirstEnv(env, {"TWIPER_LOG_LEVEL", "LOG_LEVEL"})) config->mutable_logging()->set_level(Lower(*v));
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* source = config->mutable_source();
  if (source->kind() == twiper::runtime::config::SOURCE_KIND_UNSPECIFIED) {
    source->set_kind(twiper::runtime::config::SOURCE_KIND_LOCAL);
  }
  SetIfEmpty(source->mutable_local()->mutable_root(), std::string("data"));
  SetIfEmpty(source->mutable_work_dir(), std::string("data"));
  if (source->caption_dir().empty()) {
    source->set_caption_dir(source->kind() == twiper::runtime::config::SOURCE_KIND_LOCAL ? source->local().root() : source->work_dir());
  }
  auto* drive = source->mutable_drive();
  SetIfEmpty(drive->mutable_folder_name(), std::string("XYZBlob"));
  SetIfEmpty(drive->mutable_api_base_url(), std::string("https://www.googleapis.com"));

  auto* dedup = config->mutable_dedup();
  if (dedup->backend() == twiper::runtime::config::DEDUP_BACKEND_UNSPECIFIED) {
    dedup->set_backend(twiper::runtime::config::DEDUP_BACKEND_SQLITE);
  }
  SetIfEmpty(dedup->mutable_sqlite_path(), std::string("data/twiper.db"));
  SetIfEmpty(dedup->mutable_json_path(), std::string("data/posted.json"));

  auto* upload = config->mutable_upload();
  SetIfEmpty(upload->mutable_endpoint(), std::string("https://upload.twitter.com/1.1/media/upload.json"));
  if (upload->chunk_size_bytes() == 0) upload->set_chunk_size_bytes(kDefaultChunkSizeBytes);
  if (upload->max_append_attempts() == 0) upload->set_max_append_attempts(5);
  if (upload->backoff_base_ms() == 0) upload->set_backoff_base_ms(5'000);
  if (upload->backoff_cap_ms() == 0) upload->set_backoff_cap_ms(60'000);
  if (upload->default_status_interval_secs() == 0) upload->set_default_status_interval_secs(5);
  if (upload->max_processing_wait_secs() == 0) upload->set_max_processing_wait_secs(600);

  SetIfEmpty(config->mutable_post()->mutable_endpoint(), std::string("https://api.twitter.com/2/tweets"));

  auto* http = config->mutable_http();
  if (http->connect_timeout_ms() == 0) http->set_connect_timeout_ms(60'000);
  if (http->request_timeout_ms() == 0) http->set_request_timeout_ms(600'000);
  SetIfEmpty(http->mutable_user_agent(), std::string("twiper/1.0"));
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::vector<std::string> missing;
  const auto&              credentials = config.credentials();
  if (credentials.consumer_key().empty()) missing.emplace_back("API key");
  if (credentials.consumer_secret().empty()) missing.emplace_back("API secret");
  if (credentials.access_token().empty()) missing.emplace_back("Access token");
  if (credentials.access_secret().empty()) missing.emplace_back("Access secret");
  if (!missing.empty()) {
    std::ostringstream out;
    out << "Missing OAuth credentials: ";
    for (std::size_t i = 0; i < missing.size(); ++i) {
      out << (i ? ", " : "") << missing[i];
    }
    throw ConfigurationError(out.str());
  }

  const auto& upload = config.upload();
  if (upload.chunk_size_bytes() == 0 || upload.chunk_size_bytes() > kMaxChunkSizeBytes) {
    throw ConfigurationError("upload.chunk_size_bytes must be in (0, " + std::to_string(kMaxChunkSizeBytes) + "]");
  }
  if (upload.max_append_attempts() == 0) {
    throw ConfigurationError("upload.max_append_attempts must be at least 1");
  }
  if (upload.backoff_cap_ms() < upload.backoff_base_ms()) {
    throw ConfigurationError("upload.backoff_cap_ms must not be below upload.backoff_base_ms");
  }

  const auto& source = config.source();
  switch (source.kind()) {
    case twiper::runtime::config::SOURCE_KIND_LOCAL:
      if (source.local().root().empty()) throw ConfigurationError("source.local.root is required");
      break;
    case twiper::runtime::config::SOURCE_KIND_GDRIVE:
      if (source.drive().service_account_json().empty() && source.drive().service_account_file().empty()) {
        throw ConfigurationError("Google Drive source requires GDRIVE_SERVICE_ACCOUNT_JSON or GDRIVE_SERVICE_ACCOUNT_FILE");
      }
      break;
    case twiper::runtime::config::SOURCE_KIND_OBJECT:
      if (source.object().uri().empty()) throw ConfigurationError("object source requires OBJECT_STORE_URI");
      break;
    default:
      throw ConfigurationError("source.kind is not set");
  }

  const auto& dedup = config.dedup();
  if (dedup.backend() == twiper::runtime::config::DEDUP_BACKEND_SQLITE && dedup.sqlite_path().empty()) {
    throw ConfigurationError("dedup.sqlite_path is required");
  }
  if (dedup.backend() == twiper::runtime::config::DEDUP_BACKEND_JSON && dedup.json_path().empty()) {
    throw ConfigurationError("dedup.json_path is required");
  }
}

ConfigLoader::EnvLookup ConfigLoader::ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    if (const char* value = std::getenv(name.c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  };
}

} // namespace twiper::config
