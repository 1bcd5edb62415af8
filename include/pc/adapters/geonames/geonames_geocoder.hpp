// File: include/pc/adapters/geonames/geonames_geocoder.hpp
#pragma once

#include <string>

#include "pc/adapters/http/http_client.hpp"
#include "pc/core/io/geocoder.hpp"

namespace pc {

struct GeonamesGeocoderConfig {
  std::string base_url{"http://ws.geonames.org/findNearbyPlaceName"};
  std::string username;  // optional account name
  HttpClientConfig http;
};

// findNearbyPlaceName lookups:
//   GET <base_url>?lat=<lat>&lng=<lon>[&username=<u>]
// answer: <geonames><geoname><toponymName>...</toponymName></geoname></geonames>
class GeonamesGeocoder final : public IGeocoder {
 public:
  explicit GeonamesGeocoder(GeonamesGeocoderConfig cfg);

  Result<std::string> place_name(const GeoPoint& p) override;

  std::string name() const override { return "geonames"; }

  [[nodiscard]] std::string request_url(const GeoPoint& p) const;

  // First geoname/toponymName of a response document.
  static Result<std::string> parse_response(const std::string& xml);

 private:
  GeonamesGeocoderConfig cfg_;
  HttpClient client_;
};

}  // namespace pc
