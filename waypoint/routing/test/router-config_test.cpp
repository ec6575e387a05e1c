#include "waypoint/router-config.hpp"

#include <gtest/gtest.h>

#include "invalid_argument_exception.hpp"

namespace waypoint {

TEST(RouterConfig, Defaults) {
  RouterConfig config;
  EXPECT_EQ(config.matchPolicy, RouterConfig::MatchPolicy::Direct);
  EXPECT_FALSE(config.decodeParams);
  EXPECT_EQ(config.maxSegments, 0U);
  EXPECT_NO_THROW(config.validate());
}

TEST(RouterConfig, FluentSetters) {
  auto config = RouterConfig{}
                    .withMatchPolicy(RouterConfig::MatchPolicy::Backtracking)
                    .withParamDecoding()
                    .withMaxSegments(16);
  EXPECT_EQ(config.matchPolicy, RouterConfig::MatchPolicy::Backtracking);
  EXPECT_TRUE(config.decodeParams);
  EXPECT_EQ(config.maxSegments, 16U);
  EXPECT_NO_THROW(config.validate());

  config.withParamDecoding(false);
  EXPECT_FALSE(config.decodeParams);
  EXPECT_NE(config, RouterConfig{});
}

TEST(RouterConfig, InvalidMatchPolicy) {
  RouterConfig config;
  config.matchPolicy = static_cast<RouterConfig::MatchPolicy>(42);
  EXPECT_THROW(config.validate(), invalid_argument);
}

}  // namespace waypoint
