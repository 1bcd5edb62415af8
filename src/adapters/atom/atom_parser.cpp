// File: src/adapters/atom/atom_parser.cpp
#include "pc/adapters/atom/atom_parser.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <optional>
#include <sstream>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include "pc/core/util/time_format.hpp"

namespace pc {
namespace {

struct XmlDocDeleter {
  void operator()(xmlDoc* d) const { xmlFreeDoc(d); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool is_element(const xmlNode* n, const char* ns, const char* name) {
  return n && n->type == XML_ELEMENT_NODE && n->ns && n->ns->href &&
         xmlStrEqual(n->ns->href, BAD_CAST ns) && xmlStrEqual(n->name, BAD_CAST name);
}

const xmlNode* find_child(const xmlNode* parent, const char* ns, const char* name) {
  if (!parent) return nullptr;
  for (const xmlNode* c = parent->children; c; c = c->next) {
    if (is_element(c, ns, name)) return c;
  }
  return nullptr;
}

// Trimmed text content; nullopt for a missing or blank element.
std::optional<std::string> text_of(const xmlNode* n) {
  if (!n) return std::nullopt;
  xmlChar* raw = xmlNodeGetContent(n);
  if (!raw) return std::nullopt;
  std::string s = trim(reinterpret_cast<const char*>(raw));
  xmlFree(raw);
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<Event> entry_to_event(const xmlNode* entry) {
  const xmlNode* author = find_child(entry, kAtomNs, "author");
  const auto name = text_of(find_child(author, kAtomNs, "name"));
  const auto uri = text_of(find_child(author, kAtomNs, "uri"));
  if (!name || !uri) return std::nullopt;

  const auto point_text = text_of(find_child(entry, kGeoRssNs, "point"));
  if (!point_text) return std::nullopt;
  auto point_r = parse_georss_point(*point_text);
  if (!point_r.ok()) return std::nullopt;

  const auto published = text_of(find_child(entry, kAtomNs, "published"));
  if (!published) return std::nullopt;
  auto when_r = parse_iso8601(*published);
  if (!when_r.ok()) return std::nullopt;

  return Event(*name, *uri, when_r->timestamp, point_r.value(), when_r->utc_offset_min);
}

// Entries may sit anywhere below the root (plain feeds, wrapped feeds).
void collect_entries(const xmlNode* n, std::vector<const xmlNode*>& out) {
  for (const xmlNode* c = n; c; c = c->next) {
    if (c->type != XML_ELEMENT_NODE) continue;
    if (is_element(c, kAtomNs, "entry")) {
      out.push_back(c);
      continue;
    }
    collect_entries(c->children, out);
  }
}

}  // namespace

Result<GeoPoint> parse_georss_point(const std::string& text) {
  std::istringstream ss(text);
  std::string lat_s, lon_s, extra;
  if (!(ss >> lat_s >> lon_s) || (ss >> extra)) {
    return Result<GeoPoint>::err(Status::parse_error("georss:point must be 'lat lon': '" + text + "'"));
  }

  char* end = nullptr;
  const double lat = std::strtod(lat_s.c_str(), &end);
  if (end == lat_s.c_str() || *end != '\0') {
    return Result<GeoPoint>::err(Status::parse_error("bad latitude '" + lat_s + "'"));
  }
  const double lon = std::strtod(lon_s.c_str(), &end);
  if (end == lon_s.c_str() || *end != '\0') {
    return Result<GeoPoint>::err(Status::parse_error("bad longitude '" + lon_s + "'"));
  }

  if (!std::isfinite(lat) || !std::isfinite(lon)) {
    return Result<GeoPoint>::err(Status::parse_error("non-finite coordinates: '" + text + "'"));
  }
  const GeoPoint p{lat, lon};
  if (!p.is_valid()) {
    return Result<GeoPoint>::err(Status::out_of_range("coordinates out of range: '" + text + "'"));
  }
  return Result<GeoPoint>::ok(p);
}

Result<std::vector<Event>> parse_atom_feed(const std::string& xml, AtomParseStats* stats) {
  const int opts = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
  XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "feed.xml", nullptr, opts));
  if (!doc) {
    const xmlError* err = xmlGetLastError();
    std::string detail = (err && err->message) ? trim(err->message) : "unknown error";
    return Result<std::vector<Event>>::err(Status::parse_error("feed is not well-formed XML: " + detail));
  }

  const xmlNode* root = xmlDocGetRootElement(doc.get());
  std::vector<const xmlNode*> entries;
  collect_entries(root, entries);

  std::vector<Event> events;
  events.reserve(entries.size());
  std::size_t skipped = 0;
  for (const xmlNode* entry : entries) {
    auto e = entry_to_event(entry);
    if (!e) {
      ++skipped;
      continue;
    }
    events.push_back(std::move(*e));
  }

  if (stats) {
    stats->entries = entries.size();
    stats->skipped = skipped;
  }
  return Result<std::vector<Event>>::ok(std::move(events));
}

}  // namespace pc
