#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace streamlift::http {

struct HttpResponse {
  long        status = 0;
  std::string body;
};

/*
  Blocking libcurl client. One easy handle per request, so a single
  instance is safe to share across job threads.

  Error mapping:
    transport failure, non-2xx  → util::TransientIoError
    401 / 403                   → util::CredentialExpired
*/
class HttpClient {
 public:
  using Headers = std::vector<std::pair<std::string, std::string>>;

  explicit HttpClient(std::chrono::milliseconds timeout, std::string bearer_token = {});

  HttpResponse PostJson(const std::string& url, const std::string& json_body, const Headers& headers = {}) const;
  HttpResponse Get(const std::string& url, const Headers& headers = {}) const;

  // Body of url, follows redirects.
  std::string Download(const std::string& url, const Headers& headers = {}) const;

  // Process-wide curl_global_init; call once before threads start.
  static void GlobalInit();

 private:
  HttpResponse Perform(const std::string& method, const std::string& url, const std::string* body, const Headers& headers) const;

  std::chrono::milliseconds timeout_;
  std::string               bearer_token_;
};

std::string EscapeUrlComponent(const std::string& value);

} // namespace streamlift::http
