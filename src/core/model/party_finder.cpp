// File: src/core/model/party_finder.cpp
#include "pc/core/model/party_finder.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <utility>

#include "pc/core/model/clustering.hpp"
#include "pc/core/model/spacetime.hpp"
#include "pc/core/util/repro_hash.hpp"
#include "pc/core/util/time_format.hpp"

namespace pc {

std::string format_coordinates(const GeoPoint& p) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.6f, %.6f", p.latitude, p.longitude);
  return std::string(buf);
}

PartyFinder::PartyFinder(Config cfg, std::string config_path)
    : cfg_(std::move(cfg)), config_path_(std::move(config_path)), t0_wall_ns_(wall_now_epoch_ns()) {}

void PartyFinder::ingest(const std::vector<Event>& events) { store_.update(events); }

Status PartyFinder::ingest_feed(IFeedSource& source, const std::string& feed_id) {
  auto events_r = source.fetch(feed_id);
  if (!events_r.ok()) return events_r.status().annotate(feed_id);

  ingest(events_r.value());
  ++feeds_ingested_;
  return Status::ok_status();
}

std::vector<PartyReport> PartyFinder::find_parties(double threshold_m) const {
  const SpacetimeClusterer clusterer(store_.events());
  const std::size_t min_size = static_cast<std::size_t>(std::max(1, cfg_.clustering.min_party_size));

  std::vector<PartyReport> reports;
  for (Cluster& c : clusterer.clusters_at(threshold_m)) {
    if (c.size() < min_size) continue;

    std::stable_sort(c.begin(), c.end(), [](const Event& a, const Event& b) {
      if (a.timestamp() != b.timestamp()) return a.timestamp() < b.timestamp();
      return a.key() < b.key();
    });

    PartyReport r;
    r.max_spatial_m = maximum_spatial_distance(c);
    r.max_temporal_s = maximum_temporal_distance(c);
    r.threshold_m = threshold_m;
    r.members = std::move(c);
    reports.push_back(std::move(r));
  }
  return reports;
}

std::size_t PartyFinder::enrich(std::vector<PartyReport>& reports, IGeocoder& geocoder,
                                std::ostream& warn) const {
  std::size_t fallbacks = 0;
  for (PartyReport& r : reports) {
    // Per party, not per run: each announcement stands on its own lookups.
    std::map<GeoPoint, std::string> resolved;
    r.place_names.clear();
    r.place_names.reserve(r.members.size());

    for (const Event& e : r.members) {
      auto it = resolved.find(e.position());
      if (it == resolved.end()) {
        auto name_r = geocoder.place_name(e.position());
        std::string place;
        if (name_r.ok()) {
          place = name_r.take_value();
        } else {
          place = format_coordinates(e.position());
          warn << "warning: " << geocoder.name() << ": " << name_r.status().to_string()
               << " (using coordinates)\n";
          ++fallbacks;
        }
        it = resolved.emplace(e.position(), std::move(place)).first;
      }
      r.place_names.push_back(it->second);
    }
  }
  return fallbacks;
}

RunInfo PartyFinder::run_info_(double threshold_m) const {
  const std::vector<Event> events = store_.events();

  RunInfo run;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.config_hash = compute_config_hash(cfg_);
  run.events_hash = compute_events_hash(events);
  run.threshold_m = threshold_m;
  run.feed_count = feeds_ingested_;
  run.event_count = events.size();
  run.wall_start_time_ns = t0_wall_ns_;
  return run;
}

Status PartyFinder::publish(const std::vector<PartyReport>& reports, double threshold_m,
                            ReportSink& sink) const {
  PC_RETURN_IF_ERROR(sink.open(run_info_(threshold_m)));

  // Ensure we always close cleanly.
  struct Guard {
    ReportSink& s;
    ~Guard() { s.close(); }
  } guard{sink};

  for (const PartyReport& r : reports) {
    PC_RETURN_IF_ERROR(sink.emit(r));
  }
  return sink.flush();
}

}  // namespace pc
