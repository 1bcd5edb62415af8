// File: include/pc/adapters/atom/atom_parser.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pc/core/status.hpp"
#include "pc/core/types.hpp"

namespace pc {

constexpr const char* kAtomNs = "http://www.w3.org/2005/Atom";
constexpr const char* kGeoRssNs = "http://www.georss.org/georss";

struct AtomParseStats {
  std::size_t entries{0};  // atom:entry elements seen
  std::size_t skipped{0};  // entries dropped for missing/malformed fields
};

// Extract check-ins from an Atom document with GeoRSS points.
// Per entry: atom:author/atom:name, atom:author/atom:uri, georss:point
// ("lat lon") and atom:published. Entries lacking any of them, or carrying
// unparseable values, are skipped. Only a document that is not XML at all
// fails, with parse_error.
Result<std::vector<Event>> parse_atom_feed(const std::string& xml, AtomParseStats* stats = nullptr);

// "52.5 13.4" -> GeoPoint. parse_error when malformed, out_of_range past
// +-90 / +-180.
Result<GeoPoint> parse_georss_point(const std::string& text);

}  // namespace pc
