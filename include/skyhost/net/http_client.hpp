#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace skyhost::net {

struct HttpRequestOptions {
  std::uint64_t timeout_ms = 5'000;
  // 0 leaves the connect phase bounded only by timeout_ms.
  std::uint64_t connect_timeout_ms = 0;
  bool follow_redirects = false;
  bool verify_tls = false;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  /// The request produced an HTTP status line.
  [[nodiscard]] bool completed() const { return !network_error && status != 0; }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url,
                                         const HttpRequestOptions &options) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url,
                                 const HttpRequestOptions &options) override;
};

} // namespace skyhost::net
