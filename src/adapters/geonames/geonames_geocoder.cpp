// File: src/adapters/geonames/geonames_geocoder.cpp
#include "pc/adapters/geonames/geonames_geocoder.hpp"

#include <cstdio>
#include <memory>
#include <utility>

#include <libxml/parser.h>
#include <libxml/tree.h>

namespace pc {
namespace {

struct XmlDocDeleter {
  void operator()(xmlDoc* d) const { xmlFreeDoc(d); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

// GeoNames answers without a namespace.
const xmlNode* child_named(const xmlNode* parent, const char* name) {
  if (!parent) return nullptr;
  for (const xmlNode* c = parent->children; c; c = c->next) {
    if (c->type == XML_ELEMENT_NODE && xmlStrEqual(c->name, BAD_CAST name)) return c;
  }
  return nullptr;
}

std::string content_of(const xmlNode* n) {
  xmlChar* raw = xmlNodeGetContent(n);
  if (!raw) return "";
  std::string s(reinterpret_cast<const char*>(raw));
  xmlFree(raw);
  return s;
}

std::string attribute_of(const xmlNode* n, const char* name) {
  xmlChar* raw = xmlGetProp(n, BAD_CAST name);
  if (!raw) return "";
  std::string s(reinterpret_cast<const char*>(raw));
  xmlFree(raw);
  return s;
}

std::string format_degrees(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.6f", v);
  return std::string(buf);
}

}  // namespace

GeonamesGeocoder::GeonamesGeocoder(GeonamesGeocoderConfig cfg)
    : cfg_(std::move(cfg)), client_(cfg_.http) {}

std::string GeonamesGeocoder::request_url(const GeoPoint& p) const {
  std::string url = cfg_.base_url;
  url += (url.find('?') == std::string::npos) ? '?' : '&';
  url += "lat=" + format_degrees(p.latitude) + "&lng=" + format_degrees(p.longitude);
  if (!cfg_.username.empty()) url += "&username=" + HttpClient::url_escape(cfg_.username);
  return url;
}

Result<std::string> GeonamesGeocoder::parse_response(const std::string& xml) {
  const int opts = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
  XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "geonames.xml", nullptr, opts));
  if (!doc) return Result<std::string>::err(Status::parse_error("geonames response is not XML"));

  const xmlNode* root = xmlDocGetRootElement(doc.get());

  // Service-side failures (quota, bad account) come back as <status message=.../>.
  if (const xmlNode* status = child_named(root, "status")) {
    return Result<std::string>::err(
        Status::io_error("geonames refused request: " + attribute_of(status, "message")));
  }

  const xmlNode* toponym = child_named(child_named(root, "geoname"), "toponymName");
  if (!toponym) return Result<std::string>::err(Status::not_found("no place near these coordinates"));

  std::string name = content_of(toponym);
  if (name.empty()) return Result<std::string>::err(Status::not_found("empty toponymName"));
  return Result<std::string>::ok(std::move(name));
}

Result<std::string> GeonamesGeocoder::place_name(const GeoPoint& p) {
  const std::string url = request_url(p);
  auto resp_r = client_.get(url);
  if (!resp_r.ok()) return Result<std::string>::err(resp_r.status());

  const HttpResponse& resp = resp_r.value();
  if (!resp.is_success()) {
    return Result<std::string>::err(Status::io_error("HTTP " + std::to_string(resp.status) + " for " + url));
  }
  return parse_response(resp.body);
}

}  // namespace pc
