// File: tests/report_sink_test.cpp
#include "pc/core/report/jsonl_report_sink.hpp"
#include "pc/core/report/report_sink.hpp"
#include "pc/core/report/text_report_sink.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace pc {
namespace {

using testing::make_event;

// 2012-06-01T20:10:00Z
constexpr std::int64_t kT0 = 1338581400;

PartyReport three_friends() {
  PartyReport r;
  r.members = {make_event("alice", kT0, 52.5200, 13.4050), make_event("bob", kT0 + 4 * 60, 52.5203, 13.4050),
               make_event("carol", kT0 + 21 * 60, 52.5206, 13.4050)};
  r.max_spatial_m = 66.79;
  r.max_temporal_s = 21 * 60;
  r.threshold_m = 100.0;
  return r;
}

std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream f(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(f, line);) lines.push_back(line);
  return lines;
}

TEST(JoinHumanTest, NaturalEnumeration) {
  EXPECT_EQ(join_human({}), "");
  EXPECT_EQ(join_human({"a"}), "a");
  EXPECT_EQ(join_human({"a", "b"}), "a and b");
  EXPECT_EQ(join_human({"a", "b", "c"}), "a, b and c");
  EXPECT_EQ(join_human({"a", "b", "c"}, " or "), "a, b or c");
}

TEST(PartyReportTest, DistinctPlaceNamesKeepFirstOccurrenceOrder) {
  PartyReport r = three_friends();
  r.place_names = {"Mitte", "Kreuzberg", "Mitte"};
  EXPECT_EQ(r.distinct_place_names(), (std::vector<std::string>{"Mitte", "Kreuzberg"}));
}

TEST(TextReportSinkTest, FormatsWithoutPlaces) {
  EXPECT_EQ(TextReportSink::format(three_friends()),
            "Suspected party with alice, bob and carol within a radius of 66 meters (20:10, 20:14, 20:31).");
}

TEST(TextReportSinkTest, FormatsWithPlacesAndLocalTime) {
  PartyReport r = three_friends();
  r.members[0] = Event("alice", "https://example.org/alice", TimestampNs{kT0 * kNsPerSecond},
                       GeoPoint{52.52, 13.405}, 120);
  r.place_names = {"Mitte", "Mitte", "Kreuzberg"};
  EXPECT_EQ(TextReportSink::format(r),
            "Suspected party with alice, bob and carol within a radius of 66 meters around Mitte and Kreuzberg "
            "(22:10, 20:14, 20:31).");
}

TEST(TextReportSinkTest, EmitsOneLinePerParty) {
  std::ostringstream out;
  TextReportSink sink(out);
  ASSERT_TRUE(sink.open(RunInfo{}).ok());
  ASSERT_TRUE(sink.emit(three_friends()).ok());
  ASSERT_TRUE(sink.emit(three_friends()).ok());
  ASSERT_TRUE(sink.flush().ok());
  sink.close();

  const std::string text = out.str();
  EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);
}

TEST(JsonQuoteTest, EscapesMandatoryCharacters) {
  EXPECT_EQ(json_quote("plain"), "\"plain\"");
  EXPECT_EQ(json_quote("say \"hi\"\\"), "\"say \\\"hi\\\"\\\\\"");
  EXPECT_EQ(json_quote("a\nb\tc"), "\"a\\nb\\tc\"");
  EXPECT_EQ(json_quote(std::string("\x01", 1)), "\"\\u0001\"");
  EXPECT_EQ(json_quote("Kreuzberg \xC3\xA4"), "\"Kreuzberg \xC3\xA4\"");  // UTF-8 passes through
}

TEST(JsonlReportSinkTest, WritesRunFileAndLatest) {
  testing::ScratchDir dir;
  RunInfo run;
  run.out_dir = (dir.path() / "out").string();
  run.config_hash = "00000000deadbeef";
  run.threshold_m = 100.0;
  run.wall_start_time_ns = TimestampNs{1234};

  PartyReport r = three_friends();
  r.place_names = {"Mitte", "Mitte", "Kreuzberg"};

  JsonlReportSink sink;
  ASSERT_TRUE(sink.open(run).ok());
  ASSERT_TRUE(sink.emit(r).ok());
  ASSERT_TRUE(sink.flush().ok());
  sink.close();

  EXPECT_EQ(std::filesystem::path(sink.path()).filename().string(), "parties_1234.jsonl");
  const auto lines = read_lines(sink.path());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("\"type\":\"run_started\""), std::string::npos);
  EXPECT_NE(lines[0].find("\"config_hash\":\"00000000deadbeef\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"type\":\"party\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"size\":3"), std::string::npos);
  EXPECT_NE(lines[1].find("\"name\":\"carol\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"place\":\"Kreuzberg\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"participants\":[\"alice <https://example.org/alice>\","
                          "\"bob <https://example.org/bob>\",\"carol <https://example.org/carol>\"]"),
            std::string::npos);

  EXPECT_EQ(read_lines(sink.latest_path()), lines);
}

TEST(JsonlReportSinkTest, EmitBeforeOpenIsRejected) {
  JsonlReportSink sink;
  EXPECT_EQ(sink.emit(three_friends()).code(), Status::Code::kInvalidArgument);
}

TEST(JsonlReportSinkTest, PrunesOldRunFiles) {
  testing::ScratchDir dir;
  for (int i = 1; i <= 5; ++i) dir.write("parties_" + std::to_string(i) + ".jsonl", "{}\n");
  dir.write("notes.txt", "keep me\n");

  RunInfo run;
  run.out_dir = dir.path().string();
  run.wall_start_time_ns = TimestampNs{100};

  JsonlReportSink sink(3);
  ASSERT_TRUE(sink.open(run).ok());
  sink.close();

  namespace fs = std::filesystem;
  EXPECT_FALSE(fs::exists(dir.path() / "parties_1.jsonl"));
  EXPECT_FALSE(fs::exists(dir.path() / "parties_3.jsonl"));
  EXPECT_TRUE(fs::exists(dir.path() / "parties_4.jsonl"));
  EXPECT_TRUE(fs::exists(dir.path() / "parties_5.jsonl"));
  EXPECT_TRUE(fs::exists(dir.path() / "parties_100.jsonl"));
  EXPECT_TRUE(fs::exists(dir.path() / "parties_latest.jsonl"));
  EXPECT_TRUE(fs::exists(dir.path() / "notes.txt"));
}

}  // namespace
}  // namespace pc
