// File: src/adapters/http/http_feed_source.cpp
#include "pc/adapters/http/http_feed_source.hpp"

#include <iostream>
#include <utility>

namespace pc {

HttpFeedSource::HttpFeedSource(HttpFeedSourceConfig cfg)
    : client_(std::make_unique<HttpClient>(std::move(cfg.http))), cache_(std::move(cfg.cache)) {}

HttpFeedSource::HttpFeedSource(std::unique_ptr<HttpClient> client, FileCacheConfig cache)
    : client_(std::move(client)), cache_(std::move(cache)) {}

Result<std::string> HttpFeedSource::load_body_(const std::string& feed_url, bool& from_cache) {
  from_cache = false;
  if (auto cached = cache_.get(feed_url)) {
    from_cache = true;
    return Result<std::string>::ok(std::move(*cached));
  }

  auto resp_r = client_->get(feed_url);
  if (!resp_r.ok()) return Result<std::string>::err(resp_r.status());

  HttpResponse resp = resp_r.take_value();
  if (!resp.is_success()) {
    return Result<std::string>::err(
        Status::io_error("HTTP " + std::to_string(resp.status) + " for " + feed_url));
  }
  return Result<std::string>::ok(std::move(resp.body));
}

Result<std::vector<Event>> HttpFeedSource::fetch(const std::string& feed_url) {
  bool from_cache = false;
  auto body_r = load_body_(feed_url, from_cache);
  if (!body_r.ok()) return Result<std::vector<Event>>::err(body_r.status());

  AtomParseStats stats;
  auto events_r = parse_atom_feed(body_r.value(), &stats);
  if (!events_r.ok()) return events_r;

  if (from_cache) {
    ++cache_hits_;
  } else {
    // A cache that cannot be written only costs a refetch next time.
    const Status st = cache_.set(feed_url, body_r.value());
    if (!st.ok()) std::cerr << "warning: feed cache: " << st.message() << "\n";
  }

  skipped_entries_ += stats.skipped;
  return events_r;
}

}  // namespace pc
