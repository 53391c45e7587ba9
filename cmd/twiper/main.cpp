#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using twiper::observability::StringField;

namespace {

void Usage() {
  std::cerr << "Usage: twiper\n"
            << "  Posts the next unposted media item(s) from the configured source.\n"
            << "  Settings come from the environment and the optional YAML file named by TWIPER_CONFIG.\n";
}

int Fatal(const char* kind, const std::exception& e) {
  TWIPER_LOG_ERROR("Fatal error", {StringField("kind", kind), StringField("error", e.what())});
  twiper::observability::ShutdownLogging();
  return 2;
}

} // namespace

int main(int argc, char** argv) {
  if (argc != 1) {
    Usage();
    if (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) return 0;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = twiper::config::ConfigLoader::Load(twiper::config::ConfigLoader::ProcessEnvironment());

    twiper::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = twiper::factory::Build(config);

    TWIPER_LOG_INFO("twiper started", {StringField("source", twiper::model::SourceKindName(app.source->Kind())),
                                       twiper::observability::IntField("limit", config.post().limit())});

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    auto report = app.orchestrator->Run(config.post().limit());

    TWIPER_LOG_INFO("twiper finished", {twiper::observability::IntField("posted", static_cast<std::int64_t>(report.posted)),
                                        twiper::observability::IntField("failed", static_cast<std::int64_t>(report.failed))});
    twiper::observability::ShutdownLogging();
  } catch (const twiper::util::ConfigurationError& e) {
    return Fatal("configuration", e);
  } catch (const twiper::util::StoreError& e) {
    return Fatal("store", e);
  } catch (const twiper::util::SourceError& e) {
    return Fatal("source", e);
  } catch (const std::exception& e) {
    return Fatal("internal", e);
  }

  return 0;
}
