// File: include/pc/core/model/party_finder.hpp
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "pc/core/config.hpp"
#include "pc/core/io/feed_source.hpp"
#include "pc/core/io/geocoder.hpp"
#include "pc/core/model/event_store.hpp"
#include "pc/core/report/report_sink.hpp"
#include "pc/core/status.hpp"
#include "pc/core/types.hpp"

namespace pc {

// PartyFinder owns one batch run:
//   ingest feeds -> dedup store -> cluster at threshold -> filter by size
//   -> (optional) place names -> sinks
// Clustering only ever sees the store contents; geocoding happens after the
// partition is final.
class PartyFinder {
 public:
  PartyFinder(Config cfg, std::string config_path);

  // Merge already-parsed events.
  void ingest(const std::vector<Event>& events);

  // Fetch one feed and merge it. On error the store is left untouched.
  Status ingest_feed(IFeedSource& source, const std::string& feed_id);

  [[nodiscard]] const EventStore& store() const noexcept { return store_; }
  [[nodiscard]] std::size_t feeds_ingested() const noexcept { return feeds_ingested_; }
  [[nodiscard]] const Config& config() const noexcept { return cfg_; }

  // Candidate gatherings at `threshold_m`: clusters with at least
  // clustering.min_party_size members, in clustering order.
  [[nodiscard]] std::vector<PartyReport> find_parties(double threshold_m) const;

  // Resolve place names, once per distinct coordinate per party. Lookups that
  // fail fall back to "lat, lon" and are reported on `warn`.
  // Returns the number of fallbacks.
  std::size_t enrich(std::vector<PartyReport>& reports, IGeocoder& geocoder, std::ostream& warn) const;

  // open -> emit each -> flush -> close.
  Status publish(const std::vector<PartyReport>& reports, double threshold_m, ReportSink& sink) const;

 private:
  [[nodiscard]] RunInfo run_info_(double threshold_m) const;

  Config cfg_;
  std::string config_path_;
  TimestampNs t0_wall_ns_{0};

  EventStore store_;
  std::size_t feeds_ingested_{0};
};

// "52.520008, 13.404954"
std::string format_coordinates(const GeoPoint& p);

}  // namespace pc
