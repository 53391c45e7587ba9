#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/auth/entropy_source.hpp"
#include "internal/auth/oauth1_signer.hpp"
#include "internal/caption/caption_resolver.hpp"
#include "internal/dedup/json/json_dedup_store.hpp"
#include "internal/dedup/sqlite/sqlite_dedup_store.hpp"
#include "internal/http/curl_http_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/post/post_client.hpp"
#include "internal/selection/selection_engine.hpp"
#include "internal/source/source_factory.hpp"
#include "internal/upload/chunked_uploader.hpp"
#include "internal/upload/sleeper.hpp"
#include "internal/util/errors.hpp"

namespace twiper::factory {

using namespace twiper;

namespace {

auth::Credentials ToCredentials(const twiper::runtime::config::CredentialsConfig& cfg) {
  auth::Credentials credentials;
  credentials.consumer_key    = cfg.consumer_key();
  credentials.consumer_secret = cfg.consumer_secret();
  credentials.access_token    = cfg.access_token();
  credentials.access_secret   = cfg.access_secret();
  return credentials;
}

http::HttpClientPtr BuildHttpClient(const twiper::runtime::config::HttpConfig& cfg) {
  http::CurlOptions options;
  if (cfg.connect_timeout_ms() != 0) options.connect_timeout_ms = cfg.connect_timeout_ms();
  if (cfg.request_timeout_ms() != 0) options.request_timeout_ms = cfg.request_timeout_ms();
  if (!cfg.user_agent().empty()) options.user_agent = cfg.user_agent();
  return std::make_shared<http::CurlHttpClient>(std::move(options));
}

} // namespace

dedup::DedupStorePtr BuildDedupStore(const twiper::runtime::config::DedupConfig& config) {
  switch (config.backend()) {
    case twiper::runtime::config::DEDUP_BACKEND_JSON:
      TWIPER_LOG_INFO("dedup store", {observability::StringField("backend", "json"), observability::StringField("path", config.json_path())});
      return std::make_shared<dedup::json::JsonDedupStore>(config.json_path());
    case twiper::runtime::config::DEDUP_BACKEND_UNSPECIFIED:
    case twiper::runtime::config::DEDUP_BACKEND_SQLITE:
      TWIPER_LOG_INFO("dedup store", {observability::StringField("backend", "sqlite"), observability::StringField("path", config.sqlite_path())});
      return std::make_shared<dedup::sqlite::SqliteDedupStore>(config.sqlite_path());
    default:
      break;
  }
  throw util::ConfigurationError("unsupported dedup backend " + std::to_string(static_cast<int>(config.backend())));
}

Application Build(const twiper::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildHttpClient(config.http()));
}

/*
    Build full application dependency graph
*/
Application Build(const twiper::runtime::config::RuntimeConfig& config, http::HttpClientPtr http) {
  Application app;
  app.http = std::move(http);

  // ------------------------------------------------------------------
  // Signing (credentials are checked before any network call)
  // ------------------------------------------------------------------
  auto signer = std::make_shared<auth::Oauth1Signer>(ToCredentials(config.credentials()), std::make_shared<auth::SystemEntropySource>());

  // ------------------------------------------------------------------
  // Dedup + source
  // ------------------------------------------------------------------
  app.store     = BuildDedupStore(config.dedup());
  auto selector = std::make_shared<selection::SelectionEngine>(app.store);
  app.source    = source::SourceFactory::Build(config.source(), app.http);

  // ------------------------------------------------------------------
  // Upload + post
  // ------------------------------------------------------------------
  auto uploader = std::make_shared<upload::ChunkedUploader>(app.http, signer, upload::UploadOptions::FromConfig(config.upload()),
                                                            std::make_shared<upload::ThreadSleeper>());
  auto poster   = config.post().endpoint().empty() ? std::make_shared<post::PostClient>(app.http, signer)
                                                   : std::make_shared<post::PostClient>(app.http, signer, config.post().endpoint());

  auto captions = std::make_shared<caption::LocalCaptionResolver>(config.source().caption_dir());

  app.orchestrator = std::make_shared<core::PostOrchestrator>(app.source, std::move(selector), std::move(uploader), std::move(poster),
                                                              std::move(captions));
  return app;
}

} // namespace twiper::factory
