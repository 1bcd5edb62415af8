// File: src/adapters/cache/file_cache.cpp
#include "pc/adapters/cache/file_cache.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

#include "pc/core/util/repro_hash.hpp"
#include "pc/core/util/time_format.hpp"

namespace pc {

namespace {

// now + ttl, pinned to the largest instant instead of wrapping.
std::int64_t expiry_ns(TimestampNs now, std::int64_t ttl_s) {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  if (ttl_s > kMax / kNsPerSecond) return kMax;
  const std::int64_t ttl_ns = ttl_s * kNsPerSecond;
  return (now.ns > kMax - ttl_ns) ? kMax : now.ns + ttl_ns;
}

}  // namespace

FileCache::FileCache(FileCacheConfig cfg) : cfg_(std::move(cfg)) {}

std::string FileCache::entry_path(const std::string& key) const {
  namespace fs = std::filesystem;
  return (fs::path(cfg_.dir) / (hash_string_hex(key) + ".cache")).string();
}

std::optional<std::string> FileCache::get(const std::string& key) const {
  return get_at(key, wall_now_epoch_ns());
}

std::optional<std::string> FileCache::get_at(const std::string& key, TimestampNs now) const {
  if (!enabled()) return std::nullopt;

  std::ifstream f(entry_path(key), std::ios::binary);
  if (!f.is_open()) return std::nullopt;

  std::string header;
  if (!std::getline(f, header)) return std::nullopt;

  std::int64_t expires_ns = 0;
  std::istringstream hs(header);
  if (!(hs >> expires_ns)) return std::nullopt;
  if (now.ns >= expires_ns) return std::nullopt;

  std::string payload((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) return std::nullopt;
  return payload;
}

Status FileCache::set(const std::string& key, const std::string& value) {
  return set_at(key, value, wall_now_epoch_ns());
}

Status FileCache::set_at(const std::string& key, const std::string& value, TimestampNs now) {
  if (!enabled()) return Status::ok_status();

  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  if (ec) {
    return Status::io_error("failed creating cache dir '" + cfg_.dir + "': " + ec.message());
  }

  const std::string path = entry_path(key);
  const std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return Status::io_error("failed opening '" + tmp + "'");
    f << expiry_ns(now, cfg_.ttl_s) << "\n";
    f.write(value.data(), static_cast<std::streamsize>(value.size()));
    f.flush();
    if (!f.good()) return Status::io_error("failed writing '" + tmp + "'");
  }

  // Readers never see a half-written entry.
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return Status::io_error("failed publishing cache entry '" + path + "'");
  }
  return Status::ok_status();
}

}  // namespace pc
