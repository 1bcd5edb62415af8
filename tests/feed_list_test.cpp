// File: tests/feed_list_test.cpp
#include "pc/core/io/feed_source.hpp"

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace pc {
namespace {

TEST(FeedListTest, SkipsBlanksAndComments) {
  testing::ScratchDir dir;
  const std::string path = dir.write("feeds.txt",
                                     "# berlin\n"
                                     "http://checkins.example.org/berlin.atom\n"
                                     "\n"
                                     "   \t\n"
                                     "  http://checkins.example.org/hamburg.atom  \r\n"
                                     "   # indented comment\n"
                                     "http://checkins.example.org/munich.atom");

  auto feeds_r = read_feed_list(path);
  ASSERT_TRUE(feeds_r.ok()) << feeds_r.status().to_string();
  EXPECT_EQ(feeds_r.value(), (std::vector<std::string>{"http://checkins.example.org/berlin.atom",
                                                       "http://checkins.example.org/hamburg.atom",
                                                       "http://checkins.example.org/munich.atom"}));
}

TEST(FeedListTest, EmptyFileGivesNoFeeds) {
  testing::ScratchDir dir;
  auto feeds_r = read_feed_list(dir.write("feeds.txt", ""));
  ASSERT_TRUE(feeds_r.ok());
  EXPECT_TRUE(feeds_r.value().empty());
}

TEST(FeedListTest, MissingFileIsNotFound) {
  auto feeds_r = read_feed_list("/nonexistent/feeds.txt");
  ASSERT_FALSE(feeds_r.ok());
  EXPECT_EQ(feeds_r.status().code(), Status::Code::kNotFound);
}

TEST(FeedListTest, DirectoryIsRejected) {
  testing::ScratchDir dir;
  auto feeds_r = read_feed_list(dir.path().string());
  ASSERT_FALSE(feeds_r.ok());
  EXPECT_EQ(feeds_r.status().code(), Status::Code::kInvalidArgument);
}

}  // namespace
}  // namespace pc
