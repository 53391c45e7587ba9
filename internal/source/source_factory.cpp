#include "source_factory.hpp"

#include <arrow/io/file.h>

#include "common/arrow_utils.hpp"
#include "drive/access_token_provider.hpp"
#include "drive/drive_source.hpp"
#include "fs/filesystem_source.hpp"
#include "internal/util/errors.hpp"

namespace twiper::source {

namespace config = twiper::runtime::config;

std::string SourceFactory::ServiceAccountJson(const config::DriveSourceConfig& cfg) {
  if (!cfg.service_account_json().empty()) {
    return cfg.service_account_json();
  }
  if (cfg.service_account_file().empty()) {
    throw util::ConfigurationError("drive source needs GDRIVE_SERVICE_ACCOUNT_JSON or GDRIVE_SERVICE_ACCOUNT_FILE");
  }

  auto file = arrow::io::ReadableFile::Open(cfg.service_account_file());
  if (!file.ok()) {
    throw util::ConfigurationError("cannot open service account file " + cfg.service_account_file() + ": " + file.status().ToString());
  }
  try {
    return common::ReadAll(*file)->ToString();
  } catch (const util::SourceError& e) {
    throw util::ConfigurationError("cannot read service account file " + cfg.service_account_file() + ": " + e.what());
  }
}

SourceAdapterPtr SourceFactory::Build(const config::SourceConfig& cfg, http::HttpClientPtr http) {
  switch (cfg.kind()) {
    case config::SOURCE_KIND_UNSPECIFIED:
    case config::SOURCE_KIND_LOCAL:
      return std::make_shared<LocalFolderSource>(cfg.local().root(), cfg.local().delete_after_post());

    case config::SOURCE_KIND_OBJECT:
      if (cfg.object().uri().empty()) {
        throw util::ConfigurationError("object source needs OBJECT_STORE_URI");
      }
      return ObjectStoreSource::FromUri(cfg.object().uri(), cfg.work_dir(), cfg.object().hard_delete());

    case config::SOURCE_KIND_GDRIVE: {
      const auto& drive_cfg = cfg.drive();

      drive::DriveSourceOptions options;
      if (!drive_cfg.api_base_url().empty()) options.api_base_url = drive_cfg.api_base_url();
      options.folder_id   = drive_cfg.folder_id();
      options.folder_name = drive_cfg.folder_name();
      options.drive_id    = drive_cfg.drive_id();
      options.public_url  = drive_cfg.public_url();
      options.hard_delete = drive_cfg.hard_delete();
      options.work_dir    = cfg.work_dir();

      auto tokens = std::make_shared<drive::ServiceAccountTokenProvider>(ServiceAccountJson(drive_cfg), http);
      return std::make_shared<drive::DriveSource>(std::move(options), std::move(http), std::move(tokens));
    }

    default:
      break;
  }
  throw util::ConfigurationError("unsupported source kind " + std::to_string(static_cast<int>(cfg.kind())));
}

} // namespace twiper::source
