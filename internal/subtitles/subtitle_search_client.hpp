#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/http/http_client.hpp"
#include "streamlift/v1/media_api.pb.h"

namespace streamlift::subtitles {

class SubtitleSearchClient {
 public:
  virtual ~SubtitleSearchClient() = default;

  // Candidates ordered by relevance, best first.
  virtual std::vector<streamlift::v1::SubtitleCandidate> Search(const std::string& title, std::optional<int> year) = 0;

  virtual std::string Download(const std::string& url) = 0;
};

/*
  GET {search_url}?query=<title>&year=<year>&language=en
  Api-Key header when configured. Response body: SubtitleSearchResponse JSON.
*/
class HttpSubtitleSearchClient final : public SubtitleSearchClient {
 public:
  HttpSubtitleSearchClient(std::string search_url, std::string api_key, std::shared_ptr<http::HttpClient> http);

  std::vector<streamlift::v1::SubtitleCandidate> Search(const std::string& title, std::optional<int> year) override;

  std::string Download(const std::string& url) override;

 private:
  http::HttpClient::Headers Headers() const;

  std::string                       search_url_;
  std::string                       api_key_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace streamlift::subtitles
