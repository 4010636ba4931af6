/**
 * @file test_upstream_resolver.cpp
 * @brief Sequential plain-DNS fallback over the upstream chain
 */

#include <gtest/gtest.h>
#include "TestFakes.hpp"
#include "UdpTransport.hpp"
#include "UpstreamResolver.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>

class UpstreamResolverTest : public ::testing::Test {
protected:
    Logger logger;
    FakeExchanger exchanger;
    UpstreamResolver resolver{exchanger, logger};
};

TEST_F(UpstreamResolverTest, FirstUpstreamAnswers) {
    exchanger.answer("10.0.0.53:53", {"1.2.3.4", "5.6.7.8"});
    exchanger.answer("10.0.0.54:53", {"9.9.9.9"});

    AddressList result = resolver.resolve("example.com.", {"10.0.0.53:53", "10.0.0.54:53"});

    EXPECT_EQ(result, (AddressList{"1.2.3.4", "5.6.7.8"}));
    EXPECT_EQ(exchanger.calls(), (std::vector<std::string>{"10.0.0.53:53"}));
}

TEST_F(UpstreamResolverTest, FailingUpstreamFallsThroughInOrder) {
    exchanger.fail("10.0.0.53:53");
    exchanger.answer("10.0.0.54:53", {"1.2.3.4"});

    AddressList result = resolver.resolve("example.com.", {"10.0.0.53:53", "10.0.0.54:53"});

    EXPECT_EQ(result, (AddressList{"1.2.3.4"}));
    EXPECT_EQ(exchanger.calls(), (std::vector<std::string>{"10.0.0.53:53", "10.0.0.54:53"}));
}

TEST_F(UpstreamResolverTest, EmptyAnswerStopsTheChain) {
    exchanger.answer("10.0.0.53:53", {});
    exchanger.answer("10.0.0.54:53", {"1.2.3.4"});

    AddressList result = resolver.resolve("nothing.example.", {"10.0.0.53:53", "10.0.0.54:53"});

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(exchanger.calls(), (std::vector<std::string>{"10.0.0.53:53"}));
}

TEST_F(UpstreamResolverTest, AllUpstreamsFailingYieldsEmpty) {
    exchanger.fail("10.0.0.53:53");
    exchanger.fail("10.0.0.54:53");
    exchanger.fail("10.0.0.55:53");

    AddressList result = resolver.resolve("example.com.", {"10.0.0.53:53", "10.0.0.54:53", "10.0.0.55:53"});

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(exchanger.calls().size(), 3u);
}

TEST_F(UpstreamResolverTest, EmptyChainYieldsEmpty) {
    EXPECT_TRUE(resolver.resolve("example.com.", {}).empty());
    EXPECT_TRUE(exchanger.calls().empty());
}

TEST_F(UpstreamResolverTest, OnlyARecordsAreReturned) {
    // The fake prepends a CNAME to every reply
    exchanger.answer("10.0.0.53:53", {"192.0.2.1"});
    EXPECT_EQ(resolver.resolve("cdn.example.", {"10.0.0.53:53"}), (AddressList{"192.0.2.1"}));
}

namespace {

uint16_t portOf(const Endpoint& endpoint) {
    if (endpoint.family() == AF_INET6) {
        return ntohs(reinterpret_cast<const struct sockaddr_in6*>(&endpoint.address)->sin6_port);
    }
    return ntohs(reinterpret_cast<const struct sockaddr_in*>(&endpoint.address)->sin_port);
}

} // namespace

TEST(EndpointTest, ParsesHostAndPort) {
    Endpoint endpoint = parseEndpoint("114.114.114.114:53");
    ASSERT_EQ(endpoint.family(), AF_INET);
    EXPECT_EQ(endpoint.length, sizeof(struct sockaddr_in));
    EXPECT_EQ(addressToString(endpoint.address), "114.114.114.114");
    EXPECT_EQ(portOf(endpoint), 53);
}

TEST(EndpointTest, EmptyHostMeansAnyAddress) {
    Endpoint endpoint = parseEndpoint(":5353");
    ASSERT_EQ(endpoint.family(), AF_INET);
    EXPECT_EQ(reinterpret_cast<const struct sockaddr_in*>(&endpoint.address)->sin_addr.s_addr, htonl(INADDR_ANY));
    EXPECT_EQ(portOf(endpoint), 5353);
}

TEST(EndpointTest, ResolvesHostNames) {
    Endpoint endpoint = parseEndpoint("localhost:5353");
    EXPECT_TRUE(endpoint.family() == AF_INET || endpoint.family() == AF_INET6);
    EXPECT_EQ(portOf(endpoint), 5353);
}

TEST(EndpointTest, ParsesBracketedIpv6) {
    Endpoint endpoint = parseEndpoint("[::1]:53");
    ASSERT_EQ(endpoint.family(), AF_INET6);
    EXPECT_EQ(endpoint.length, sizeof(struct sockaddr_in6));
    EXPECT_EQ(addressToString(endpoint.address), "::1");
    EXPECT_EQ(portOf(endpoint), 53);
}

TEST(EndpointTest, RejectsMalformedEndpoints) {
    EXPECT_THROW(parseEndpoint("8.8.8.8"), std::runtime_error);
    EXPECT_THROW(parseEndpoint("8.8.8.8:dns"), std::runtime_error);
    EXPECT_THROW(parseEndpoint("8.8.8.8:70000"), std::runtime_error);
    EXPECT_THROW(parseEndpoint("::1:53"), std::runtime_error);
    EXPECT_THROW(parseEndpoint("[::1:53"), std::runtime_error);
}

TEST(UdpTransportTest, InvalidEndpointIsTransportError) {
    UdpTransport transport;
    DnsMessage query = DnsMessage::queryFor(1, "example.com.");
    EXPECT_THROW(transport.exchange(query, "not-an-endpoint"), std::runtime_error);
}
