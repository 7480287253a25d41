#pragma once

#include <string>
#include <utility>
#include <vector>

namespace vaultd::net {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  long        status = 0;
  std::string body;
};

/*
  Minimal blocking HTTP client.

  Transport failures (DNS, refused connection, timeout) throw
  std::runtime_error; any HTTP status is returned to the caller.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse PostJson(const std::string& url, const std::string& body, const HttpHeaders& headers, long timeout_ms) = 0;

  virtual HttpResponse Get(const std::string& url, long timeout_ms) = 0;
};

// libcurl easy-handle per request.
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();

  HttpResponse PostJson(const std::string& url, const std::string& body, const HttpHeaders& headers, long timeout_ms) override;

  HttpResponse Get(const std::string& url, long timeout_ms) override;
};

} // namespace vaultd::net
