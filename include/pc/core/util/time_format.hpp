// File: include/pc/core/util/time_format.hpp
#pragma once

#include <string>

#include "pc/core/status.hpp"
#include "pc/core/types.hpp"

namespace pc {

struct ParsedInstant {
  TimestampNs timestamp;   // UTC
  int utc_offset_min = 0;  // as written in the source text
};

// ISO 8601 / RFC 3339 date-time as found in Atom <published>:
//   2012-06-01T22:15:00Z, 2012-06-01T22:15:00.250+02:00, 2012-06-01 22:15:00+0200
// No designator means UTC. Instants outside int64 nanoseconds (before 1677 or
// after 2262) are out_of_range.
Result<ParsedInstant> parse_iso8601(const std::string& text);

// "HH:MM" wall-clock time at the given UTC offset.
std::string format_hhmm(TimestampNs t, int utc_offset_min);

// Wall clock now, epoch ns.
TimestampNs wall_now_epoch_ns();

}  // namespace pc
