#pragma once

#include <memory>
#include <string>

#include "internal/api/media_api.hpp"
#include "internal/http/http_client.hpp"

namespace streamlift::api {

/*
  HTTP client for the media backend.

      POST {base}/{tenant}/media/{jobId}/playlist/process
      POST {base}/{tenant}/media/{jobId}/status
*/
class MediaApiClient final : public ManifestFinalizer, public StatusSink {
 public:
  MediaApiClient(std::string base_url, std::shared_ptr<http::HttpClient> http);

  void Finalize(const model::TransferJob& job, uint32_t segment_count, uint32_t total_segments, bool is_complete) override;

  void Push(const model::TransferJob& job, const StatusUpdate& update) override;

 private:
  std::string MediaUrl(const model::TransferJob& job, const std::string& suffix) const;

  std::string                       base_url_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace streamlift::api
