// File: tests/geonames_geocoder_test.cpp
#include "pc/adapters/geonames/geonames_geocoder.hpp"

#include <gtest/gtest.h>

namespace pc {
namespace {

TEST(GeonamesGeocoderTest, RequestUrlCarriesCoordinates) {
  GeonamesGeocoderConfig cfg;
  cfg.base_url = "http://ws.geonames.org/findNearbyPlaceName";
  const GeonamesGeocoder geo(cfg);

  EXPECT_EQ(geo.request_url(GeoPoint{52.52, 13.405}),
            "http://ws.geonames.org/findNearbyPlaceName?lat=52.520000&lng=13.405000");
}

TEST(GeonamesGeocoderTest, RequestUrlAppendsEscapedUsername) {
  GeonamesGeocoderConfig cfg;
  cfg.base_url = "http://api.example.org/find?style=short";
  cfg.username = "party people";
  const GeonamesGeocoder geo(cfg);

  EXPECT_EQ(geo.request_url(GeoPoint{-33.8688, 151.2093}),
            "http://api.example.org/find?style=short&lat=-33.868800&lng=151.209300&username=party%20people");
}

TEST(GeonamesGeocoderTest, ParsesFirstToponym) {
  const std::string xml = R"(<?xml version="1.0" encoding="UTF-8" standalone="no"?>
<geonames>
  <geoname>
    <toponymName>Mitte</toponymName>
    <name>Berlin-Mitte</name>
    <lat>52.52437</lat>
    <lng>13.41053</lng>
    <distance>0.61</distance>
  </geoname>
  <geoname>
    <toponymName>Kreuzberg</toponymName>
  </geoname>
</geonames>)";

  auto name_r = GeonamesGeocoder::parse_response(xml);
  ASSERT_TRUE(name_r.ok()) << name_r.status().to_string();
  EXPECT_EQ(name_r.value(), "Mitte");
}

TEST(GeonamesGeocoderTest, NoGeonameIsNotFound) {
  auto name_r = GeonamesGeocoder::parse_response("<geonames></geonames>");
  ASSERT_FALSE(name_r.ok());
  EXPECT_EQ(name_r.status().code(), Status::Code::kNotFound);
}

TEST(GeonamesGeocoderTest, ServiceErrorIsIoError) {
  auto name_r = GeonamesGeocoder::parse_response(
      R"(<geonames><status message="the daily limit of 20000 credits has been exceeded" value="18"/></geonames>)");
  ASSERT_FALSE(name_r.ok());
  EXPECT_EQ(name_r.status().code(), Status::Code::kIoError);
  EXPECT_NE(name_r.status().message().find("daily limit"), std::string::npos);
}

TEST(GeonamesGeocoderTest, GarbageIsParseError) {
  auto name_r = GeonamesGeocoder::parse_response("<html><body>oops");
  ASSERT_FALSE(name_r.ok());
  EXPECT_EQ(name_r.status().code(), Status::Code::kParseError);
}

TEST(HttpClientTest, UrlEscapeKeepsUnreserved) {
  EXPECT_EQ(HttpClient::url_escape("AZaz09-._~"), "AZaz09-._~");
  EXPECT_EQ(HttpClient::url_escape("a b&c=d/\xC3\xA4"), "a%20b%26c%3Dd%2F%C3%A4");
}

}  // namespace
}  // namespace pc
