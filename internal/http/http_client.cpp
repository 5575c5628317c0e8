#include "http_client.hpp"

#include <curl/curl.h>

#include <mutex>

#include "internal/util/errors.hpp"

namespace streamlift::http {

namespace {

struct CurlHandle {
  CURL* h = nullptr;
  CurlHandle() : h(curl_easy_init()) {
  }
  ~CurlHandle() {
    if (h) curl_easy_cleanup(h);
  }
  CurlHandle(const CurlHandle&)            = delete;
  CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlHeaders {
  curl_slist* list = nullptr;
  ~CurlHeaders() {
    if (list) curl_slist_free_all(list);
  }
  void Append(const std::string& line) {
    auto* next = curl_slist_append(list, line.c_str());
    if (!next) throw util::TransientIoError("curl_slist_append failed");
    list = next;
  }
};

size_t WriteToString(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(data, size * nmemb);
  return size * nmemb;
}

std::once_flag g_curl_init;

} // namespace

void HttpClient::GlobalInit() {
  std::call_once(g_curl_init, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

HttpClient::HttpClient(std::chrono::milliseconds timeout, std::string bearer_token)
    : timeout_(timeout), bearer_token_(std::move(bearer_token)) {
  GlobalInit();
}

HttpResponse HttpClient::Perform(const std::string& method, const std::string& url, const std::string* body,
                                 const Headers& headers) const {
  CurlHandle ch;
  if (!ch.h) throw util::TransientIoError("curl init failed");

  CurlHeaders hdr;
  for (const auto& [name, value] : headers) hdr.Append(name + ": " + value);
  if (!bearer_token_.empty()) hdr.Append("Authorization: Bearer " + bearer_token_);

  HttpResponse response;
  curl_easy_setopt(ch.h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(ch.h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(ch.h, CURLOPT_MAXREDIRS, 8L);
  curl_easy_setopt(ch.h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(ch.h, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(ch.h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(ch.h, CURLOPT_CONNECTTIMEOUT_MS, 8000L);
  curl_easy_setopt(ch.h, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(ch.h, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(ch.h, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(ch.h, CURLOPT_SSL_VERIFYHOST, 2L);

  if (method == "POST") {
    hdr.Append("Content-Type: application/json");
    curl_easy_setopt(ch.h, CURLOPT_POST, 1L);
    curl_easy_setopt(ch.h, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(ch.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }
  curl_easy_setopt(ch.h, CURLOPT_HTTPHEADER, hdr.list);

  CURLcode rc = curl_easy_perform(ch.h);
  if (rc != CURLE_OK) {
    throw util::TransientIoError(method + " " + url + " failed: " + curl_easy_strerror(rc));
  }
  curl_easy_getinfo(ch.h, CURLINFO_RESPONSE_CODE, &response.status);

  if (response.status == 401 || response.status == 403) {
    throw util::CredentialExpired(method + " " + url + " rejected with HTTP " + std::to_string(response.status));
  }
  if (response.status < 200 || response.status >= 300) {
    throw util::TransientIoError(method + " " + url + " returned HTTP " + std::to_string(response.status));
  }
  return response;
}

HttpResponse HttpClient::PostJson(const std::string& url, const std::string& json_body, const Headers& headers) const {
  return Perform("POST", url, &json_body, headers);
}

HttpResponse HttpClient::Get(const std::string& url, const Headers& headers) const {
  return Perform("GET", url, nullptr, headers);
}

std::string HttpClient::Download(const std::string& url, const Headers& headers) const {
  return Perform("GET", url, nullptr, headers).body;
}

std::string EscapeUrlComponent(const std::string& value) {
  CurlHandle ch;
  if (!ch.h) throw util::TransientIoError("curl init failed");
  char* escaped = curl_easy_escape(ch.h, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) throw util::TransientIoError("curl_easy_escape failed");
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

} // namespace streamlift::http
