#pragma once

#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "internal/source/source_adapter.hpp"

namespace twiper::source {

/*
  Builds the configured media source.

      auto source = SourceFactory::Build(config.source(), http);
      auto items  = source->ListCandidates();
*/
class SourceFactory {
 public:
  // Throws util::ConfigurationError for incomplete backend settings.
  static SourceAdapterPtr Build(const twiper::runtime::config::SourceConfig& cfg, http::HttpClientPtr http);

  // Inline service account JSON, or the content of service_account_file.
  static std::string ServiceAccountJson(const twiper::runtime::config::DriveSourceConfig& cfg);
};

} // namespace twiper::source
