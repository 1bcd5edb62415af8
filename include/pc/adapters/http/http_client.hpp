// File: include/pc/adapters/http/http_client.hpp
#pragma once

#include <cstddef>
#include <string>

#include "pc/core/status.hpp"

namespace pc {

struct HttpClientConfig {
  long timeout_ms{10000};
  std::string user_agent{"partycluster/1.0"};

  // Bodies larger than this abort the transfer (0 = unlimited).
  std::size_t max_bytes{8u * 1024u * 1024u};
};

struct HttpResponse {
  long status{0};
  std::string body;
  std::string content_type;
  std::string final_url;

  [[nodiscard]] bool is_success() const noexcept { return status >= 200 && status < 300; }
};

// Blocking GET over libcurl. One easy handle per request; redirects followed.
// get() is virtual so feed sources can be driven without a network.
class HttpClient {
 public:
  explicit HttpClient(HttpClientConfig cfg);
  virtual ~HttpClient() = default;

  // Transport failures are io_error. Non-2xx answers are returned as-is so the
  // caller decides what a 404 means.
  virtual Result<HttpResponse> get(const std::string& url) const;

  // Percent-encode a query component.
  static std::string url_escape(const std::string& s);

 private:
  HttpClientConfig cfg_;
};

}  // namespace pc
