// File: include/pc/adapters/http/http_feed_source.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "pc/adapters/atom/atom_parser.hpp"
#include "pc/adapters/cache/file_cache.hpp"
#include "pc/adapters/http/http_client.hpp"
#include "pc/core/io/feed_source.hpp"

namespace pc {

struct HttpFeedSourceConfig {
  HttpClientConfig http;
  FileCacheConfig cache;
};

// Atom feeds over HTTP, cached on disk for cache.ttl_s.
// Only 2xx bodies that parse as Atom are cached, so a transient error or a
// captive-portal page is retried next run.
class HttpFeedSource final : public IFeedSource {
 public:
  explicit HttpFeedSource(HttpFeedSourceConfig cfg);
  HttpFeedSource(std::unique_ptr<HttpClient> client, FileCacheConfig cache);

  Result<std::vector<Event>> fetch(const std::string& feed_url) override;

  std::string name() const override { return "http_feed"; }

  // Counters for the run summary.
  std::size_t cache_hits() const noexcept { return cache_hits_; }
  std::size_t skipped_entries() const noexcept { return skipped_entries_; }

 private:
  // `from_cache` tells the caller whether the body still needs storing.
  Result<std::string> load_body_(const std::string& feed_url, bool& from_cache);

  std::unique_ptr<HttpClient> client_;
  FileCache cache_;

  std::size_t cache_hits_{0};
  std::size_t skipped_entries_{0};
};

}  // namespace pc
