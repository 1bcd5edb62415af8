// File: tests/party_finder_test.cpp
#include "pc/core/model/party_finder.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace pc {
namespace {

using testing::make_event;

class FakeFeedSource final : public IFeedSource {
 public:
  void add(const std::string& id, std::vector<Event> events) { feeds_[id] = std::move(events); }

  Result<std::vector<Event>> fetch(const std::string& feed_id) override {
    const auto it = feeds_.find(feed_id);
    if (it == feeds_.end()) return Result<std::vector<Event>>::err(Status::io_error("HTTP 404"));
    return Result<std::vector<Event>>::ok(it->second);
  }

  std::string name() const override { return "fake_feed"; }

 private:
  std::map<std::string, std::vector<Event>> feeds_;
};

class FakeGeocoder final : public IGeocoder {
 public:
  Result<std::string> place_name(const GeoPoint& p) override {
    ++calls;
    if (fail) return Result<std::string>::err(Status::io_error("network down"));
    std::ostringstream ss;
    ss << "place@" << p.latitude;
    return Result<std::string>::ok(ss.str());
  }

  std::string name() const override { return "fake_geocoder"; }

  int calls = 0;
  bool fail = false;
};

class RecordingSink final : public ReportSink {
 public:
  Status open(const RunInfo& run) override {
    log.push_back("open");
    this->run = run;
    return Status{};
  }
  Status emit(const PartyReport& r) override {
    log.push_back("emit");
    reports.push_back(r);
    return Status{};
  }
  Status flush() override {
    log.push_back("flush");
    return Status{};
  }
  void close() override { log.push_back("close"); }

  std::vector<std::string> log;
  std::vector<PartyReport> reports;
  RunInfo run;
};

// alice, gina, bob, carol: one party in Berlin (gina shares alice's spot).
// dave, erin: a couple 5 km away.
// frank: at alice's spot two hours later.
std::vector<Event> berlin_evening() {
  return {make_event("bob", 110, 52.5203, 13.4050),   make_event("alice", 100, 52.5200, 13.4050),
          make_event("carol", 120, 52.5206, 13.4050), make_event("gina", 100, 52.5200, 13.4050),
          make_event("dave", 100, 52.5650, 13.4050),  make_event("erin", 105, 52.5651, 13.4050),
          make_event("frank", 7300, 52.5200, 13.4050)};
}

TEST(PartyFinderTest, ReportsOnlyClustersOfThreeOrMore) {
  PartyFinder finder(Config{}, "");
  finder.ingest(berlin_evening());

  const auto reports = finder.find_parties(100.0);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].members.size(), 4u);
  EXPECT_DOUBLE_EQ(reports[0].threshold_m, 100.0);
}

TEST(PartyFinderTest, MembersSortedByTimestampThenKey) {
  PartyFinder finder(Config{}, "");
  finder.ingest(berlin_evening());

  const auto reports = finder.find_parties(100.0);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].participant_names(), (std::vector<std::string>{"alice", "gina", "bob", "carol"}));
  EXPECT_EQ(reports[0].participant_keys()[0], "alice <https://example.org/alice>");
  EXPECT_DOUBLE_EQ(reports[0].max_temporal_s, 20.0);
  EXPECT_GT(reports[0].max_spatial_m, 60.0);
  EXPECT_LT(reports[0].max_spatial_m, 70.0);
}

TEST(PartyFinderTest, MinPartySizeIsConfigurable) {
  Config cfg;
  cfg.clustering.min_party_size = 2;
  PartyFinder finder(cfg, "");
  finder.ingest(berlin_evening());

  const auto reports = finder.find_parties(100.0);
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_EQ(reports[0].members.size(), 4u);  // alice's cluster sorts first
  EXPECT_EQ(reports[1].members.size(), 2u);
}

TEST(PartyFinderTest, NothingReportedBelowThreshold) {
  PartyFinder finder(Config{}, "");
  finder.ingest(berlin_evening());
  EXPECT_TRUE(finder.find_parties(10.0).empty());
}

TEST(PartyFinderTest, IngestFeedMergesAndCounts) {
  FakeFeedSource src;
  src.add("feed-a", {make_event("alice", 100, 52.52, 13.40)});
  src.add("feed-b", {make_event("alice", 200, 52.53, 13.41), make_event("bob", 100, 52.52, 13.40)});

  PartyFinder finder(Config{}, "");
  ASSERT_TRUE(finder.ingest_feed(src, "feed-b").ok());
  ASSERT_TRUE(finder.ingest_feed(src, "feed-a").ok());

  EXPECT_EQ(finder.feeds_ingested(), 2u);
  EXPECT_EQ(finder.store().size(), 2u);
  EXPECT_EQ(finder.store().find(DedupKey{"alice", "https://example.org/alice"})->timestamp().ns,
            200 * kNsPerSecond);
}

TEST(PartyFinderTest, FailedFeedLeavesStoreUntouched) {
  FakeFeedSource src;
  PartyFinder finder(Config{}, "");

  const Status st = finder.ingest_feed(src, "http://gone.example/feed");
  EXPECT_EQ(st.code(), Status::Code::kIoError);
  EXPECT_NE(st.message().find("http://gone.example/feed"), std::string::npos);
  EXPECT_TRUE(finder.store().empty());
  EXPECT_EQ(finder.feeds_ingested(), 0u);
}

TEST(PartyFinderTest, EnrichLooksUpEachDistinctCoordinateOnce) {
  PartyFinder finder(Config{}, "");
  finder.ingest(berlin_evening());
  auto reports = finder.find_parties(100.0);
  ASSERT_EQ(reports.size(), 1u);

  FakeGeocoder geo;
  std::ostringstream warn;
  EXPECT_EQ(finder.enrich(reports, geo, warn), 0u);

  EXPECT_EQ(geo.calls, 3);  // alice and gina share a spot
  ASSERT_EQ(reports[0].place_names.size(), 4u);
  EXPECT_EQ(reports[0].place_names[0], reports[0].place_names[1]);
  EXPECT_EQ(reports[0].distinct_place_names().size(), 3u);
  EXPECT_TRUE(warn.str().empty());
}

TEST(PartyFinderTest, EnrichFallsBackToCoordinates) {
  PartyFinder finder(Config{}, "");
  finder.ingest(berlin_evening());
  auto reports = finder.find_parties(100.0);

  FakeGeocoder geo;
  geo.fail = true;
  std::ostringstream warn;
  EXPECT_EQ(finder.enrich(reports, geo, warn), 3u);

  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].place_names[0], "52.520000, 13.405000");
  EXPECT_NE(warn.str().find("network down"), std::string::npos);
}

TEST(PartyFinderTest, PublishDrivesSinkLifecycle) {
  PartyFinder finder(Config{}, "party.yaml");
  finder.ingest(berlin_evening());
  const auto reports = finder.find_parties(100.0);

  RecordingSink sink;
  ASSERT_TRUE(finder.publish(reports, 100.0, sink).ok());

  EXPECT_EQ(sink.log, (std::vector<std::string>{"open", "emit", "flush", "close"}));
  EXPECT_EQ(sink.run.config_path, "party.yaml");
  EXPECT_EQ(sink.run.event_count, 7u);
  EXPECT_DOUBLE_EQ(sink.run.threshold_m, 100.0);
  EXPECT_EQ(sink.run.config_hash.size(), 16u);
  EXPECT_EQ(sink.run.events_hash.size(), 16u);
}

TEST(PartyFinderTest, SameInputSameReports) {
  PartyFinder a(Config{}, "");
  PartyFinder b(Config{}, "");
  a.ingest(berlin_evening());
  auto reversed = berlin_evening();
  std::reverse(reversed.begin(), reversed.end());
  b.ingest(reversed);

  const auto ra = a.find_parties(100.0);
  const auto rb = b.find_parties(100.0);
  ASSERT_EQ(ra.size(), rb.size());
  for (std::size_t i = 0; i < ra.size(); ++i) EXPECT_EQ(ra[i].members, rb[i].members);
}

}  // namespace
}  // namespace pc
