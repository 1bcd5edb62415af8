// File: include/pc/core/config.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include "pc/core/status.hpp"

namespace pc {

// Units policy:
// - Distances and the clustering threshold in metres (c = 1 m/s)
// - Cache expiry in seconds, network timeouts in milliseconds

// -----------------------------
// Clustering
// -----------------------------
struct ClusteringConfig {
  // Fallback when the command line gives no threshold. The CLI always wins.
  std::optional<double> threshold_m;

  // Clusters smaller than this are noise (one person, or a couple).
  int min_party_size = 3;
};

// -----------------------------
// Feed retrieval
// -----------------------------
// One year. Keeps expiry instants (epoch ns) well inside int64_t.
inline constexpr std::int64_t kMaxCacheTtlS = 365LL * 24 * 3600;

struct FeedsConfig {
  std::string cache_dir = "cache_dir";

  // Fetched feeds stay valid this long. 0 disables the cache.
  std::int64_t cache_ttl_s = 3600;

  long timeout_ms = 10000;
  std::string user_agent = "partycluster/1.0";
};

// -----------------------------
// Reverse geocoding (report enrichment only)
// -----------------------------
struct GeocoderConfig {
  bool enabled = true;
  std::string base_url = "http://ws.geonames.org/findNearbyPlaceName";

  // GeoNames account; appended as &username= when non-empty.
  std::string username;

  long timeout_ms = 10000;
};

// -----------------------------
// Output
// -----------------------------
struct OutputConfig {
  // Where JSONL party reports go.
  std::string out_dir = "out";

  // Text announcements always go to stdout; this adds the JSONL files.
  bool jsonl = false;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  ClusteringConfig clustering;
  FeedsConfig feeds;
  GeocoderConfig geocoder;
  OutputConfig output;
};

inline Status validate_threshold(double threshold_m) {
  if (!std::isfinite(threshold_m) || threshold_m < 0.0) {
    return Status::invalid_argument("threshold must be a finite number >= 0");
  }
  return Status::ok_status();
}

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.clustering.threshold_m) {
    PC_RETURN_IF_ERROR(validate_threshold(*cfg.clustering.threshold_m).annotate("threshold_m"));
  }
  if (cfg.clustering.min_party_size < 1) {
    return Status::invalid_argument("min_party_size must be >= 1");
  }
  if (cfg.feeds.cache_ttl_s < 0) {
    return Status::invalid_argument("feeds.cache_ttl_s must be >= 0");
  }
  if (cfg.feeds.cache_ttl_s > kMaxCacheTtlS) {
    return Status::invalid_argument("feeds.cache_ttl_s must be <= " + std::to_string(kMaxCacheTtlS));
  }
  if (cfg.feeds.cache_ttl_s > 0 && cfg.feeds.cache_dir.empty()) {
    return Status::invalid_argument("feeds.cache_dir must not be empty when caching is enabled");
  }
  if (cfg.feeds.timeout_ms <= 0) {
    return Status::invalid_argument("feeds.timeout_ms must be > 0");
  }
  if (cfg.geocoder.enabled && cfg.geocoder.base_url.empty()) {
    return Status::invalid_argument("geocoder.base_url must not be empty when enabled");
  }
  if (cfg.geocoder.timeout_ms <= 0) {
    return Status::invalid_argument("geocoder.timeout_ms must be > 0");
  }
  if (cfg.output.jsonl && cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty when jsonl is enabled");
  }
  return Status::ok_status();
}

}  // namespace pc
