#include <gtest/gtest.h>
#include "../main/src/endpoint.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"

class EndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }
};

TEST_F(EndpointTest, ParsesAllSegments) {
    RepositoryEndpoint ep = parse_endpoint("ghrelasset://acme/widgets/maven/repo.zip");
    EXPECT_EQ(ep.scheme, "ghrelasset");
    EXPECT_EQ(ep.owner, "acme");
    EXPECT_EQ(ep.repo, "widgets");
    EXPECT_EQ(ep.tag, "maven");
    EXPECT_EQ(ep.asset_name, "repo.zip");
    EXPECT_EQ(ep.repository(), "acme/widgets");
    EXPECT_EQ(ep.canonical(), "ghrelasset://acme/widgets/maven/repo.zip");
}

TEST_F(EndpointTest, RejectsMalformedUris) {
    EXPECT_THROW(parse_endpoint("ghrelasset://acme/widgets/repo.zip"), ConfigurationException);
    EXPECT_THROW(parse_endpoint("ghrelasset://acme/widgets/maven/repo.tar"), ConfigurationException);
    EXPECT_THROW(parse_endpoint("ghrelasset://acme//maven/repo.zip"), ConfigurationException);
    EXPECT_THROW(parse_endpoint("ghrelasset://acme/widgets/maven/sub/repo.zip"), ConfigurationException);
    EXPECT_THROW(parse_endpoint("acme/widgets/maven/repo.zip"), ConfigurationException);
    EXPECT_THROW(parse_endpoint("ghrelasset://acme/widgets/maven/.zip"), ConfigurationException);
    EXPECT_THROW(parse_endpoint(""), ConfigurationException);
}

TEST_F(EndpointTest, CacheKeyIsStableAndDistinct) {
    RepositoryEndpoint a = parse_endpoint("ghrelasset://acme/widgets/maven/repo.zip");
    RepositoryEndpoint b = parse_endpoint("ghrelasset://acme/widgets/maven/repo.zip");
    RepositoryEndpoint c = parse_endpoint("ghrelasset://acme/widgets/snapshots/repo.zip");

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.cache_key(), b.cache_key());
    EXPECT_NE(a.cache_key(), c.cache_key());
    ASSERT_EQ(a.cache_key().size(), 40u);
    EXPECT_EQ(a.cache_key().find_first_not_of("0123456789abcdef"), std::string::npos);
}
