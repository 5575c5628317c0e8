#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/api/media_api_client.hpp"
#include "internal/auth/credential_provider.hpp"
#include "internal/catalog/media_locator.hpp"
#include "internal/conversion/conversion_cache.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/http/http_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/upload_pipeline.hpp"
#include "internal/queue/inbox_queue.hpp"
#include "internal/scheduler/job_scheduler.hpp"
#include "internal/service/worker_service.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/subtitles/subtitle_resolver.hpp"
#include "internal/subtitles/subtitle_search_client.hpp"
#include "internal/transcode/ffmpeg_transcoder.hpp"

namespace streamlift::factory {

using namespace streamlift;
using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

/*
  One object store per distinct key set. A refresh that rotates the keys
  yields a new store for subsequent jobs; jobs already running keep theirs.
*/
class CachedStoreProvider {
 public:
  explicit CachedStoreProvider(streamlift::runtime::config::StorageConfig config) : config_(std::move(config)) {
  }

  storage::ObjectStorePtr operator()(const auth::Credentials& credentials) {
    const auto cache_key = credentials.access_key + '\n' + credentials.session_token;

    std::lock_guard lock(mutex_);
    if (store_ && cache_key == cache_key_) {
      return store_;
    }

    storage::common::S3Credentials s3;
    s3.access_key    = credentials.access_key;
    s3.secret_key    = credentials.secret_key;
    s3.session_token = credentials.session_token;

    store_     = storage::StorageFactory::Build(config_, s3);
    cache_key_ = cache_key;
    return store_;
  }

 private:
  const streamlift::runtime::config::StorageConfig config_;

  std::mutex              mutex_;
  std::string             cache_key_;
  storage::ObjectStorePtr store_;
};

std::shared_ptr<subtitles::SubtitleResolver> BuildSubtitleResolver(const streamlift::runtime::config::RuntimeConfig& config,
                                                                   const config::WorkerSettings& settings, transcode::TranscoderPtr transcoder,
                                                                   std::chrono::milliseconds http_timeout) {
  const auto& subtitle_config = config.subtitles();
  if (!subtitle_config.enabled()) {
    return nullptr;
  }

  std::shared_ptr<subtitles::SubtitleSearchClient> search;
  if (!subtitle_config.search_url().empty()) {
    search = std::make_shared<subtitles::HttpSubtitleSearchClient>(subtitle_config.search_url(), subtitle_config.api_key(),
                                                                  std::make_shared<http::HttpClient>(http_timeout));
  }

  subtitles::SubtitleSettings subtitle_settings;
  subtitle_settings.enabled        = true;
  subtitle_settings.max_candidates = settings.max_subtitle_candidates;
  if (!subtitle_config.unzip_path().empty()) subtitle_settings.unzip_path = subtitle_config.unzip_path();

  return std::make_shared<subtitles::SubtitleResolver>(std::move(transcoder), std::move(search), subtitle_settings);
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const streamlift::runtime::config::RuntimeConfig& config, util::CancellationToken cancel) {
  Application app;
  app.settings         = config::ResolveWorkerSettings(config);
  const auto& settings = app.settings;

  http::HttpClient::GlobalInit();
  const std::chrono::milliseconds http_timeout(config.api().timeout_ms() > 0 ? config.api().timeout_ms() : 30000);

  // ------------------------------------------------------------------
  // Credentials and storage
  // ------------------------------------------------------------------
  auto credentials = std::make_shared<auth::StaticCredentialProvider>(config.credentials());
  if (credentials->Current().identity_id.empty()) {
    throw std::invalid_argument("credentials.identity_id is required");
  }

  auto store_provider = std::make_shared<CachedStoreProvider>(config.storage());
  pipeline::ObjectStoreProvider store_for = [store_provider](const auth::Credentials& creds) { return (*store_provider)(creds); };

  storage::common::KeyLayout layout(config.storage().media_upload_path(), config.storage().playlist_upload_path());

  // ------------------------------------------------------------------
  // Conversion
  // ------------------------------------------------------------------
  std::filesystem::create_directories(settings.staging_dir);
  auto transcoder = std::make_shared<transcode::FfmpegTranscoder>(config.transcoder().ffmpeg_path(), config.transcoder().ffprobe_path());
  auto cache      = std::make_shared<conversion::ConversionCache>(settings.staging_dir);
  auto resolver   = BuildSubtitleResolver(config, settings, transcoder, http_timeout);

  // ------------------------------------------------------------------
  // Media API
  // ------------------------------------------------------------------
  auto api_client = std::make_shared<api::MediaApiClient>(config.api().base_url(),
                                                          std::make_shared<http::HttpClient>(http_timeout, config.api().bearer_token()));

  // ------------------------------------------------------------------
  // Pipeline and scheduling
  // ------------------------------------------------------------------
  pipeline::PipelineDependencies deps;
  deps.credentials = credentials;
  deps.store_for   = store_for;
  deps.layout      = layout;
  deps.transcoder  = transcoder;
  deps.cache       = cache;
  deps.subtitles   = resolver;
  deps.finalizer   = api_client;
  deps.status      = api_client;

  pipeline::PipelineSettings pipeline_settings;
  pipeline_settings.transfer.concurrent_uploads       = settings.concurrent_uploads;
  pipeline_settings.transfer.priority_segments        = settings.priority_segments;
  pipeline_settings.transfer.segment_duration_seconds = settings.segment_duration_seconds;
  pipeline_settings.status_interval                   = std::chrono::milliseconds(settings.status_interval_ms);
  pipeline_settings.refresh_margin                    = std::chrono::milliseconds(settings.refresh_margin_ms);
  pipeline_settings.keep_staging                      = settings.keep_staging;

  auto pipeline  = std::make_shared<pipeline::UploadPipeline>(std::move(deps), pipeline_settings);
  auto scheduler = std::make_shared<scheduler::JobScheduler>(
      [pipeline, cancel](const model::TransferJob& job) { pipeline->Run(job, cancel); }, settings.max_concurrent_jobs);
  scheduler->Start();

  auto inbox   = std::make_shared<queue::InboxQueue>(std::chrono::milliseconds(settings.visibility_timeout_ms));
  auto locator = std::make_shared<catalog::MediaLocator>(settings.library_root);
  app.consumer = std::make_shared<queue::QueueConsumer>(inbox, scheduler, locator, settings.consumer_threads);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.credentials = credentials;
  app.context.store_for   = store_for;
  app.context.layout      = layout;
  app.context.transcoder  = transcoder;
  app.context.inbox       = inbox;
  app.context.scheduler   = scheduler;

  auto worker_service = std::make_shared<service::WorkerService>(app.context);
  app.grpc_services.push_back(std::make_unique<grpc::WorkerServer>(worker_service));

  STREAMLIFT_LOG_INFO("Worker assembled", {StringField("staging_dir", settings.staging_dir), StringField("library_root", settings.library_root),
                                           IntField("max_concurrent_jobs", settings.max_concurrent_jobs),
                                           IntField("concurrent_uploads", settings.concurrent_uploads),
                                           IntField("priority_segments", settings.priority_segments)});
  return app;
}

} // namespace streamlift::factory
