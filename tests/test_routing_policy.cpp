/**
 * @file test_routing_policy.cpp
 * @brief Policy file loading and exact-name matching
 */

#include <gtest/gtest.h>
#include "RoutingPolicy.hpp"
#include "TestFakes.hpp"

class RoutingPolicyTest : public ::testing::Test {
protected:
    Logger logger;
};

TEST_F(RoutingPolicyTest, LoadsTrimmedDomainsAsFqdn) {
    TempFile file("pac");
    file.write("example.com\n  blocked.example.org \r\n\tvideo.example.net.\n\n");

    RoutingPolicy policy(logger);
    policy.loadFrom(file.path());

    EXPECT_EQ(policy.size(), 3u);
    EXPECT_TRUE(policy.matches("example.com."));
    EXPECT_TRUE(policy.matches("blocked.example.org."));
    EXPECT_TRUE(policy.matches("video.example.net."));
}

TEST_F(RoutingPolicyTest, MatchingIsExactWithoutWildcards) {
    RoutingPolicy policy(logger);
    policy.add("example.com");

    EXPECT_TRUE(policy.matches("example.com."));
    EXPECT_TRUE(policy.matches("example.com"));
    EXPECT_FALSE(policy.matches("www.example.com."));
    EXPECT_FALSE(policy.matches("com."));
    EXPECT_FALSE(policy.matches("example.co."));
}

TEST_F(RoutingPolicyTest, MissingFileLeavesPolicyEmpty) {
    TempFile file("nopac");
    RoutingPolicy policy(logger);
    EXPECT_NO_THROW(policy.loadFrom(file.path()));
    EXPECT_EQ(policy.size(), 0u);
    EXPECT_FALSE(policy.matches("example.com."));
}

TEST_F(RoutingPolicyTest, BlankLinesAddNoRootRule) {
    RoutingPolicy policy(logger);
    policy.add("   ");
    policy.add("");
    EXPECT_EQ(policy.size(), 0u);
    EXPECT_FALSE(policy.matches("."));
}
