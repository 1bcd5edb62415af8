// File: src/core/util/repro_hash.cpp
#include "pc/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace pc {
namespace {

// FNV-1a 64-bit. Not cryptographic; fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) { add_u64(std::bit_cast<std::uint64_t>(v)); }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Clustering. Absent threshold hashes differently from 0.
  h.add_bool(cfg.clustering.threshold_m.has_value());
  h.add_double(cfg.clustering.threshold_m.value_or(0.0));
  h.add_i32(cfg.clustering.min_party_size);

  // Feeds.
  h.add_string(cfg.feeds.cache_dir);
  h.add_i64(cfg.feeds.cache_ttl_s);
  h.add_i64(static_cast<std::int64_t>(cfg.feeds.timeout_ms));
  h.add_string(cfg.feeds.user_agent);

  // Geocoder.
  h.add_bool(cfg.geocoder.enabled);
  h.add_string(cfg.geocoder.base_url);
  h.add_string(cfg.geocoder.username);
  h.add_i64(static_cast<std::int64_t>(cfg.geocoder.timeout_ms));

  // Output.
  h.add_string(cfg.output.out_dir);
  h.add_bool(cfg.output.jsonl);

  return to_hex(h.h);
}

std::string compute_events_hash(const std::vector<Event>& events) {
  Fnv1a64 h;
  h.add_u64(static_cast<std::uint64_t>(events.size()));
  for (const Event& e : events) {
    h.add_string(e.name());
    h.add_string(e.identity_uri());
    h.add_i64(e.timestamp().ns);
    h.add_double(e.latitude());
    h.add_double(e.longitude());
  }
  return to_hex(h.h);
}

std::string hash_string_hex(const std::string& s) {
  Fnv1a64 h;
  h.add_bytes(s.data(), s.size());
  return to_hex(h.h);
}

}  // namespace pc
