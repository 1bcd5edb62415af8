// File: src/core/report/text_report_sink.cpp
#include "pc/core/report/text_report_sink.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

#include "pc/core/util/time_format.hpp"

namespace pc {

std::string TextReportSink::format(const PartyReport& r) {
  std::vector<std::string> times;
  times.reserve(r.members.size());
  for (const Event& e : r.members) times.push_back(format_hhmm(e.timestamp(), e.utc_offset_min()));

  std::string line = "Suspected party with " + join_human(r.participant_names());
  line += " within a radius of " +
          std::to_string(static_cast<std::int64_t>(std::floor(r.max_spatial_m))) + " meters";

  const std::vector<std::string> places = r.distinct_place_names();
  if (!places.empty()) line += " around " + join_human(places);

  std::string joined_times;
  for (std::size_t i = 0; i < times.size(); ++i) {
    if (i > 0) joined_times += ", ";
    joined_times += times[i];
  }
  line += " (" + joined_times + ").";
  return line;
}

Status TextReportSink::open(const RunInfo& /*run*/) {
  return out_.good() ? Status{} : Status::io_error("text output stream is not writable");
}

Status TextReportSink::emit(const PartyReport& r) {
  out_ << format(r) << "\n";
  if (!out_.good()) return Status::io_error("failed writing party announcement");
  return Status{};
}

Status TextReportSink::flush() {
  out_.flush();
  if (!out_.good()) return Status::io_error("failed flushing party announcements");
  return Status{};
}

}  // namespace pc
