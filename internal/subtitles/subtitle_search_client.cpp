#include "subtitle_search_client.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace streamlift::subtitles {

HttpSubtitleSearchClient::HttpSubtitleSearchClient(std::string search_url, std::string api_key, std::shared_ptr<http::HttpClient> http)
    : search_url_(std::move(search_url)), api_key_(std::move(api_key)), http_(std::move(http)) {
}

http::HttpClient::Headers HttpSubtitleSearchClient::Headers() const {
  http::HttpClient::Headers headers = {{"Accept", "application/json"}};
  if (!api_key_.empty()) headers.emplace_back("Api-Key", api_key_);
  return headers;
}

std::vector<streamlift::v1::SubtitleCandidate> HttpSubtitleSearchClient::Search(const std::string& title, std::optional<int> year) {
  std::string url = search_url_ + (search_url_.find('?') == std::string::npos ? "?" : "&") + "query=" + http::EscapeUrlComponent(title);
  if (year) url += "&year=" + std::to_string(*year);
  url += "&language=en";

  auto response = http_->Get(url, Headers());

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  streamlift::v1::SubtitleSearchResponse parsed;
  auto                                   status = google::protobuf::util::JsonStringToMessage(response.body, &parsed, options);
  if (!status.ok()) {
    throw util::TransientIoError("unreadable subtitle search response: " + std::string(status.message()));
  }

  std::vector<streamlift::v1::SubtitleCandidate> candidates(parsed.results().begin(), parsed.results().end());
  std::stable_sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) { return a.score() > b.score(); });
  return candidates;
}

std::string HttpSubtitleSearchClient::Download(const std::string& url) {
  return http_->Download(url, Headers());
}

} // namespace streamlift::subtitles
