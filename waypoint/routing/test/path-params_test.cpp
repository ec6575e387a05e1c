#include "waypoint/path-params.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "exception.hpp"

namespace waypoint {

class PathParamsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    params.emplace_back("post_id", "12");
    params.emplace_back("comment_id", "100");
  }

  PathParams params;
};

TEST_F(PathParamsTest, FindAndAt) {
  EXPECT_EQ(params.find("post_id"), std::string_view("12"));
  EXPECT_EQ(params.at("comment_id"), "100");
  EXPECT_FALSE(params.find("nope").has_value());
  EXPECT_TRUE(params.contains("post_id"));
  EXPECT_FALSE(params.contains("post"));
  EXPECT_THROW((void)params.at("nope"), exception);
}

TEST_F(PathParamsTest, OrderIsPreserved) {
  ASSERT_EQ(params.size(), 2U);
  EXPECT_EQ(params[0].key, "post_id");
  EXPECT_EQ(params[1].key, "comment_id");

  std::vector<std::string> keys;
  for (const auto& [key, value] : params) {
    keys.push_back(key + '=' + value);
  }
  EXPECT_EQ(keys, (std::vector<std::string>{"post_id=12", "comment_id=100"}));
}

TEST_F(PathParamsTest, DuplicateKeyReturnsOutermost) {
  params.emplace_back("post_id", "13");
  EXPECT_EQ(params.at("post_id"), "12");
  EXPECT_EQ(params.size(), 3U);
}

TEST_F(PathParamsTest, InsertReplacesExistingBinding) {
  EXPECT_EQ(params.insert("post_id", "42"), std::string("12"));
  EXPECT_EQ(params.at("post_id"), "42");
  ASSERT_EQ(params.size(), 2U);
  EXPECT_EQ(params[0].key, "post_id");
  EXPECT_EQ(params[1].key, "comment_id");
}

TEST_F(PathParamsTest, InsertAppendsNewBinding) {
  EXPECT_FALSE(params.insert("user_id", "7").has_value());
  ASSERT_EQ(params.size(), 3U);
  EXPECT_EQ(params[2].key, "user_id");
  EXPECT_EQ(params.at("user_id"), "7");
}

TEST_F(PathParamsTest, InsertReplacesOutermostOfDuplicates) {
  params.emplace_back("post_id", "13");
  EXPECT_EQ(params.insert("post_id", "1"), std::string("12"));
  EXPECT_EQ(params[0].value, "1");
  EXPECT_EQ(params[2].value, "13");
}

TEST_F(PathParamsTest, Remove) {
  EXPECT_EQ(params.remove("post_id"), std::string("12"));
  EXPECT_FALSE(params.contains("post_id"));
  ASSERT_EQ(params.size(), 1U);
  EXPECT_EQ(params[0].key, "comment_id");

  EXPECT_FALSE(params.remove("post_id").has_value());
  EXPECT_FALSE(params.remove("nope").has_value());
  EXPECT_EQ(params.size(), 1U);
}

TEST_F(PathParamsTest, RemoveUncoversInnerDuplicate) {
  params.emplace_back("post_id", "13");
  EXPECT_EQ(params.remove("post_id"), std::string("12"));
  EXPECT_EQ(params.at("post_id"), "13");
}

TEST_F(PathParamsTest, Equality) {
  PathParams other;
  EXPECT_NE(params, other);
  other.emplace_back("post_id", "12");
  other.emplace_back("comment_id", "100");
  EXPECT_EQ(params, other);

  other.clear();
  other.emplace_back("comment_id", "100");
  other.emplace_back("post_id", "12");
  EXPECT_NE(params, other);
}

TEST_F(PathParamsTest, Empty) {
  PathParams empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.begin(), empty.end());
  params.clear();
  EXPECT_EQ(params, empty);
}

}  // namespace waypoint
