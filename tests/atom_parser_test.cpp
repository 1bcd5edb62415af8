// File: tests/atom_parser_test.cpp
#include "pc/adapters/atom/atom_parser.hpp"

#include <string>

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace pc {
namespace {

// 2012-06-01T00:00:00Z
constexpr std::int64_t kJune1st2012 = 1338508800;

TEST(AtomParserTest, ExtractsWellFormedEntries) {
  const std::string xml = testing::read_test_data("checkins.atom");
  ASSERT_FALSE(xml.empty());

  AtomParseStats stats;
  auto events_r = parse_atom_feed(xml, &stats);
  ASSERT_TRUE(events_r.ok()) << events_r.status().to_string();
  const auto& events = events_r.value();

  EXPECT_EQ(stats.entries, 5u);
  EXPECT_EQ(stats.skipped, 3u);
  ASSERT_EQ(events.size(), 2u);

  EXPECT_EQ(events[0].name(), "alice");
  EXPECT_EQ(events[0].identity_uri(), "https://checkins.example.org/alice");
  EXPECT_EQ(events[0].timestamp().ns, (kJune1st2012 + 20 * 3600 + 10 * 60) * kNsPerSecond);
  EXPECT_EQ(events[0].utc_offset_min(), 120);
  EXPECT_DOUBLE_EQ(events[0].latitude(), 52.52);
  EXPECT_DOUBLE_EQ(events[0].longitude(), 13.405);

  EXPECT_EQ(events[1].name(), "bob");  // trimmed
  EXPECT_DOUBLE_EQ(events[1].latitude(), 52.5203);
  EXPECT_EQ(events[1].utc_offset_min(), 0);
}

TEST(AtomParserTest, EmptyFeedIsNotAnError) {
  auto events_r = parse_atom_feed(R"(<feed xmlns="http://www.w3.org/2005/Atom"><title>t</title></feed>)");
  ASSERT_TRUE(events_r.ok());
  EXPECT_TRUE(events_r.value().empty());
}

TEST(AtomParserTest, IgnoresEntriesOutsideTheAtomNamespace) {
  const std::string xml = R"(<feed xmlns:georss="http://www.georss.org/georss">
    <entry><published>2012-06-01T20:00:00Z</published>
      <author><name>x</name><uri>u</uri></author>
      <georss:point>1 2</georss:point></entry>
  </feed>)";
  AtomParseStats stats;
  auto events_r = parse_atom_feed(xml, &stats);
  ASSERT_TRUE(events_r.ok());
  EXPECT_TRUE(events_r.value().empty());
  EXPECT_EQ(stats.entries, 0u);
}

TEST(AtomParserTest, MalformedXmlIsParseError) {
  auto events_r = parse_atom_feed("<feed><entry></feed>");
  ASSERT_FALSE(events_r.ok());
  EXPECT_EQ(events_r.status().code(), Status::Code::kParseError);

  EXPECT_FALSE(parse_atom_feed("").ok());
  EXPECT_FALSE(parse_atom_feed("404 Not Found").ok());
}

TEST(GeoRssPointTest, ParsesLatitudeThenLongitude) {
  auto p = parse_georss_point("-33.8688 151.2093");
  ASSERT_TRUE(p.ok());
  EXPECT_DOUBLE_EQ(p.value().latitude, -33.8688);
  EXPECT_DOUBLE_EQ(p.value().longitude, 151.2093);
}

TEST(GeoRssPointTest, RejectsMalformedPoints) {
  for (const char* bad : {"", "52.52", "52.52 13.40 7", "north 13.40", "52.52 13.40x", "nan 0"}) {
    auto p = parse_georss_point(bad);
    EXPECT_FALSE(p.ok()) << bad;
    if (!p.ok()) EXPECT_EQ(p.status().code(), Status::Code::kParseError);
  }
}

TEST(GeoRssPointTest, RejectsCoordinatesOffTheGlobe) {
  EXPECT_EQ(parse_georss_point("91 0").status().code(), Status::Code::kOutOfRange);
  EXPECT_EQ(parse_georss_point("0 -181").status().code(), Status::Code::kOutOfRange);
  EXPECT_TRUE(parse_georss_point("90 -180").ok());
}

}  // namespace
}  // namespace pc
