// File: include/pc/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pc {

// -----------------------------
// Time
// -----------------------------
// Instants are integer nanoseconds since the Unix epoch (UTC).
// The feed's own UTC offset travels separately and is only used for display.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

constexpr std::int64_t kNsPerSecond = 1'000'000'000;

// -----------------------------
// Geography
// -----------------------------

// WGS84 decimal degrees.
struct GeoPoint {
  double latitude = 0.0;
  double longitude = 0.0;

  bool operator==(const GeoPoint& other) const noexcept {
    return latitude == other.latitude && longitude == other.longitude;
  }
  bool operator!=(const GeoPoint& other) const noexcept { return !(*this == other); }
  bool operator<(const GeoPoint& other) const noexcept {
    if (latitude != other.latitude) return latitude < other.latitude;
    return longitude < other.longitude;
  }

  [[nodiscard]] bool is_valid() const noexcept {
    return latitude >= -90.0 && latitude <= 90.0 && longitude >= -180.0 && longitude <= 180.0;
  }
};

// -----------------------------
// Author identity
// -----------------------------

// Same name + same identity URI == same timeline. Compared field by field,
// so names containing " <" cannot collide with other authors.
struct DedupKey {
  std::string name;
  std::string identity_uri;

  bool operator==(const DedupKey& other) const {
    return name == other.name && identity_uri == other.identity_uri;
  }
  bool operator!=(const DedupKey& other) const { return !(*this == other); }
  bool operator<(const DedupKey& other) const {
    if (name != other.name) return name < other.name;
    return identity_uri < other.identity_uri;
  }

  // "name <identity_uri>"
  [[nodiscard]] std::string display() const { return name + " <" + identity_uri + ">"; }
};

// -----------------------------
// Check-in event
// -----------------------------

// Immutable once built. Replacing an author's event means storing a new Event.
class Event {
 public:
  Event(std::string name, std::string identity_uri, TimestampNs timestamp, GeoPoint position,
        int utc_offset_min = 0)
      : key_{std::move(name), std::move(identity_uri)},
        timestamp_(timestamp),
        position_(position),
        utc_offset_min_(utc_offset_min) {}

  const std::string& name() const noexcept { return key_.name; }
  const std::string& identity_uri() const noexcept { return key_.identity_uri; }
  const DedupKey& key() const noexcept { return key_; }

  TimestampNs timestamp() const noexcept { return timestamp_; }
  const GeoPoint& position() const noexcept { return position_; }
  double latitude() const noexcept { return position_.latitude; }
  double longitude() const noexcept { return position_.longitude; }

  // Offset of the feed's local time from UTC, for HH:MM rendering only.
  int utc_offset_min() const noexcept { return utc_offset_min_; }

  bool operator==(const Event& other) const {
    return key_ == other.key_ && timestamp_ == other.timestamp_ &&
           position_ == other.position_ && utc_offset_min_ == other.utc_offset_min_;
  }
  bool operator!=(const Event& other) const { return !(*this == other); }

 private:
  DedupKey key_;
  TimestampNs timestamp_;
  GeoPoint position_;
  int utc_offset_min_ = 0;
};

using Cluster = std::vector<Event>;

}  // namespace pc
