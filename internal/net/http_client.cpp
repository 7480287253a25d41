#include "internal/net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace vaultd::net {

namespace {

// curl_global_init is not thread-safe; run it once for the process.
void EnsureCurlGlobal() {
  static std::once_flag once;
  std::call_once(once, [] {
    const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  const size_t total  = size * nmemb;
  auto*        buffer = static_cast<std::string*>(userdata);
  buffer->append(ptr, total);
  return total;
}

struct CurlHandleDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlSlist  = std::unique_ptr<curl_slist, SlistDeleter>;

CurlHandle NewHandle(const std::string& url, long timeout_ms, std::string* response) {
  CurlHandle handle(curl_easy_init());
  if (!handle) {
    throw std::runtime_error("curl_easy_init failed");
  }

  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, response);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  // signals are unsafe from worker threads
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  return handle;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  EnsureCurlGlobal();
}

HttpResponse CurlHttpClient::PostJson(const std::string& url, const std::string& body, const HttpHeaders& headers, long timeout_ms) {
  std::string response;
  auto        handle = NewHandle(url, timeout_ms, &response);

  curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  curl_slist* raw_list = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto& header : headers) {
    const std::string line = header.first + ": " + header.second;
    raw_list               = curl_slist_append(raw_list, line.c_str());
  }
  CurlSlist header_list(raw_list);
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());

  const CURLcode code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    std::ostringstream oss;
    oss << "[http] POST " << url << " failed " << curl_easy_strerror(code);
    throw std::runtime_error(oss.str());
  }

  HttpResponse out;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &out.status);
  out.body = std::move(response);
  return out;
}

HttpResponse CurlHttpClient::Get(const std::string& url, long timeout_ms) {
  std::string response;
  auto        handle = NewHandle(url, timeout_ms, &response);
  curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);

  const CURLcode code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    std::ostringstream oss;
    oss << "[http] GET " << url << " failed " << curl_easy_strerror(code);
    throw std::runtime_error(oss.str());
  }

  HttpResponse out;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &out.status);
  out.body = std::move(response);
  return out;
}

} // namespace vaultd::net
