// File: src/adapters/http/http_client.cpp
#include "pc/adapters/http/http_client.hpp"

#include <memory>
#include <mutex>
#include <utility>

#include <curl/curl.h>

namespace pc {
namespace {

struct CurlWriteCtx {
  std::string* out;
  std::size_t max_bytes;
  bool truncated;
};

size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<CurlWriteCtx*>(userdata);
  const size_t total = size * nmemb;
  if (ctx->max_bytes > 0 && ctx->out->size() + total > ctx->max_bytes) {
    ctx->truncated = true;
    return 0;  // aborts the transfer with CURLE_WRITE_ERROR
  }
  ctx->out->append(ptr, total);
  return total;
}

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlEasyDeleter {
  void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

}  // namespace

HttpClient::HttpClient(HttpClientConfig cfg) : cfg_(std::move(cfg)) { ensure_curl_global_init(); }

Result<HttpResponse> HttpClient::get(const std::string& url) const {
  CurlEasyPtr curl(curl_easy_init());
  if (!curl) return Result<HttpResponse>::err(Status::internal("curl_easy_init failed"));

  HttpResponse res;
  CurlWriteCtx ctx{&res.body, cfg_.max_bytes, false};
  char errbuf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, cfg_.timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, cfg_.user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (ctx.truncated) {
    return Result<HttpResponse>::err(
        Status::io_error("response from " + url + " exceeds " + std::to_string(cfg_.max_bytes) + " bytes"));
  }
  if (rc != CURLE_OK) {
    const std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
    return Result<HttpResponse>::err(Status::io_error("GET " + url + " failed: " + detail));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
  char* ct = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &ct);
  if (ct) res.content_type = ct;
  char* final_url = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &final_url);
  if (final_url) res.final_url = final_url;

  return Result<HttpResponse>::ok(std::move(res));
}

std::string HttpClient::url_escape(const std::string& s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
    if (unreserved) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0xF]);
    }
  }
  return out;
}

}  // namespace pc
