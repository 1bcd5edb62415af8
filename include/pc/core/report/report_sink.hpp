// File: include/pc/core/report/report_sink.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pc/core/status.hpp"
#include "pc/core/types.hpp"

namespace pc {

// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string config_path;  // empty when running on defaults
  std::string out_dir;

  std::string config_hash;
  std::string events_hash;

  double threshold_m = 0.0;
  std::size_t feed_count = 0;
  std::size_t event_count = 0;  // distinct authors clustered

  TimestampNs wall_start_time_ns;
};

// One candidate gathering, ready for presentation.
struct PartyReport {
  // Sorted by timestamp ascending (ties by dedup key).
  std::vector<Event> members;

  // Extent of the gathering.
  double max_spatial_m = 0.0;
  double max_temporal_s = 0.0;

  double threshold_m = 0.0;

  // Aligned with `members`. Empty until place names are resolved.
  std::vector<std::string> place_names;

  [[nodiscard]] std::vector<std::string> participant_names() const;
  [[nodiscard]] std::vector<std::string> participant_keys() const;  // "name <uri>"

  // Place names without repeats, in member order.
  [[nodiscard]] std::vector<std::string> distinct_place_names() const;
};

class ReportSink {
 public:
  virtual ~ReportSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const PartyReport& r) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

// "a", "a and b", "a, b and c"
std::string join_human(const std::vector<std::string>& items, const std::string& last_sep = " and ");

}  // namespace pc
