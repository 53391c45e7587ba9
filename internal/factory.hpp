#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/post_orchestrator.hpp"
#include "internal/dedup/dedup_store.hpp"
#include "internal/http/http_client.hpp"
#include "internal/source/source_adapter.hpp"

namespace twiper::factory {

/*
  Application

  Owns every long-lived component of one run.
*/
struct Application {
  http::HttpClientPtr        http;
  dedup::DedupStorePtr       store;
  source::SourceAdapterPtr   source;
  std::shared_ptr<core::PostOrchestrator> orchestrator;
};

/*
  Build

  Constructs the dependency graph from a validated RuntimeConfig.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store, source and transport types.

  Throws ConfigurationError, StoreError.
*/
Application Build(const twiper::runtime::config::RuntimeConfig& config);

// Same graph over an injected transport.
Application Build(const twiper::runtime::config::RuntimeConfig& config, http::HttpClientPtr http);

dedup::DedupStorePtr BuildDedupStore(const twiper::runtime::config::DedupConfig& config);

} // namespace twiper::factory
