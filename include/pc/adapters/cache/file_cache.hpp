// File: include/pc/adapters/cache/file_cache.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "pc/core/status.hpp"
#include "pc/core/types.hpp"

namespace pc {

struct FileCacheConfig {
  std::string dir{"cache_dir"};
  std::int64_t ttl_s{3600};  // 0 disables the cache
};

// Directory-backed key/value store with a fixed expiry window.
// One file per key, named by the key's FNV-1a hash:
//   line 1: expiry instant (epoch ns)
//   rest:   payload, verbatim
class FileCache {
 public:
  explicit FileCache(FileCacheConfig cfg);

  [[nodiscard]] bool enabled() const noexcept { return cfg_.ttl_s > 0; }

  // Missing, expired, unreadable and disabled all read as a miss.
  [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
  [[nodiscard]] std::optional<std::string> get_at(const std::string& key, TimestampNs now) const;

  Status set(const std::string& key, const std::string& value);
  Status set_at(const std::string& key, const std::string& value, TimestampNs now);

  // Path of the entry file for `key` (exists or not).
  [[nodiscard]] std::string entry_path(const std::string& key) const;

 private:
  FileCacheConfig cfg_;
};

}  // namespace pc
