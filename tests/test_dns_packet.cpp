/**
 * @file test_dns_packet.cpp
 * @brief Wire format decoding and encoding
 */

#include <gtest/gtest.h>
#include "DnsPacket.hpp"
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

// Query for example.com A, id 0x1234, RD set
const std::vector<uint8_t> EXAMPLE_QUERY = {
    0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x07, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0x03, 'c', 'o', 'm', 0x00,
    0x00, 0x01, 0x00, 0x01
};

// Reply for www.example.com: CNAME to example.com (compressed) then A
const std::vector<uint8_t> CNAME_REPLY = {
    0xab, 0xcd, 0x81, 0x80, 0x00, 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00,
    // question at offset 12: www.example.com A IN
    0x03, 'w', 'w', 'w', 0x07, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0x03, 'c', 'o', 'm', 0x00,
    0x00, 0x01, 0x00, 0x01,
    // answer 1: name -> offset 12, CNAME, IN, ttl 300, rdata -> offset 16
    0xc0, 0x0c, 0x00, 0x05, 0x00, 0x01, 0x00, 0x00, 0x01, 0x2c, 0x00, 0x02, 0xc0, 0x10,
    // answer 2: name -> offset 16, A, IN, ttl 300, 93.184.216.34
    0xc0, 0x10, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x01, 0x2c, 0x00, 0x04, 93, 184, 216, 34
};

// Single question packet whose name has labels of the given lengths
std::vector<uint8_t> queryWithLabels(const std::vector<size_t>& labels) {
    std::vector<uint8_t> packet = {0x00, 0x07, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    for (size_t len : labels) {
        packet.push_back(static_cast<uint8_t>(len));
        packet.insert(packet.end(), len, 'a');
    }
    packet.push_back(0x00);
    const uint8_t typeAndClass[] = {0x00, 0x01, 0x00, 0x01};
    packet.insert(packet.end(), typeAndClass, typeAndClass + sizeof(typeAndClass));
    return packet;
}

} // namespace

TEST(DnsPacketTest, DecodesQuery) {
    DnsMessage msg = DnsPacket::decode(EXAMPLE_QUERY);
    EXPECT_EQ(msg.id, 0x1234);
    EXPECT_FALSE(msg.isResponse());
    EXPECT_TRUE(msg.recursionDesired());
    EXPECT_EQ(msg.getOpcode(), 0);
    ASSERT_EQ(msg.questions.size(), 1u);
    EXPECT_EQ(msg.questions[0].name, "example.com");
    EXPECT_EQ(msg.questions[0].type, DnsType::A);
    EXPECT_EQ(msg.questions[0].class_, DnsClass::IN);
}

TEST(DnsPacketTest, DecodesCompressedCnameChain) {
    DnsMessage msg = DnsPacket::decode(CNAME_REPLY);
    EXPECT_TRUE(msg.isResponse());
    ASSERT_EQ(msg.answers.size(), 2u);
    EXPECT_EQ(msg.answers[0].name, "www.example.com");
    EXPECT_EQ(msg.answers[0].type, DnsType::CNAME);
    EXPECT_EQ(msg.answers[0].data, "example.com");
    EXPECT_EQ(msg.answers[1].name, "example.com");
    EXPECT_EQ(msg.answers[1].type, DnsType::A);
    EXPECT_EQ(msg.answers[1].ttl, 300u);
    EXPECT_EQ(msg.answers[1].data, "93.184.216.34");
}

TEST(DnsPacketTest, ReplyCarriesAnswersWithDefaultTtl) {
    DnsMessage query = DnsPacket::decode(EXAMPLE_QUERY);
    DnsMessage reply = DnsMessage::replyTo(query);
    DnsAnswer answer;
    answer.name = "example.com.";
    answer.data = "93.184.216.34";
    reply.answers.push_back(answer);

    std::vector<uint8_t> wire = DnsPacket::encode(reply);
    DnsMessage decoded = DnsPacket::decode(wire);

    EXPECT_EQ(decoded.id, 0x1234);
    EXPECT_TRUE(decoded.isResponse());
    EXPECT_TRUE(decoded.recursionDesired());
    EXPECT_EQ(decoded.getRCode(), 0);
    ASSERT_EQ(decoded.questions.size(), 1u);
    ASSERT_EQ(decoded.answers.size(), 1u);
    EXPECT_EQ(decoded.answers[0].name, "example.com");
    EXPECT_EQ(decoded.answers[0].class_, DnsClass::IN);
    EXPECT_EQ(decoded.answers[0].ttl, DEFAULT_ANSWER_TTL);
    EXPECT_EQ(decoded.answers[0].data, "93.184.216.34");
}

TEST(DnsPacketTest, SkipsAdditionalOptRecord) {
    std::vector<uint8_t> withEdns = EXAMPLE_QUERY;
    withEdns[11] = 0x01;
    // root name, OPT, udp size 4096, ext rcode/flags, rdlength 0
    const uint8_t opt[] = {0x00, 0x00, 0x29, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    withEdns.insert(withEdns.end(), opt, opt + sizeof(opt));

    DnsMessage msg = DnsPacket::decode(withEdns);
    ASSERT_EQ(msg.questions.size(), 1u);
    EXPECT_TRUE(msg.additional.empty());
}

TEST(DnsPacketTest, RejectsTruncatedPacket) {
    std::vector<uint8_t> shortPacket(EXAMPLE_QUERY.begin(), EXAMPLE_QUERY.begin() + 20);
    EXPECT_THROW(DnsPacket::decode(shortPacket), std::runtime_error);
    EXPECT_THROW(DnsPacket::decode(std::vector<uint8_t>(5, 0)), std::runtime_error);
}

TEST(DnsPacketTest, RejectsForwardCompressionPointer) {
    std::vector<uint8_t> looping = {
        0x00, 0x01, 0x81, 0x80, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xc0, 0x0c, 0x00, 0x01, 0x00, 0x01
    };
    EXPECT_THROW(DnsPacket::decode(looping), std::runtime_error);
}

TEST(DnsPacketTest, EncodeRejectsInvalidAddress) {
    DnsMessage reply;
    DnsAnswer answer;
    answer.name = "bad.example.";
    answer.data = "not-an-ip";
    reply.answers.push_back(answer);
    EXPECT_THROW(DnsPacket::encode(reply), std::runtime_error);
}

TEST(DnsPacketTest, NonQueryOpcodeIsPreservedInReply) {
    DnsMessage query = DnsPacket::decode(EXAMPLE_QUERY);
    query.setOpcode(2);
    DnsMessage reply = DnsMessage::replyTo(query);
    EXPECT_EQ(reply.getOpcode(), 2);
    EXPECT_TRUE(reply.isResponse());
}

TEST(DnsPacketTest, NameLimitCountsRootLabel) {
    // 255 bytes on the wire: decodes and encodes again
    DnsMessage longest = DnsPacket::decode(queryWithLabels({63, 63, 63, 61}));
    ASSERT_EQ(longest.questions.size(), 1u);
    EXPECT_NO_THROW(DnsPacket::encode(DnsMessage::replyTo(longest)));

    // 256 bytes on the wire
    EXPECT_THROW(DnsPacket::decode(queryWithLabels({63, 63, 63, 62})), std::runtime_error);
}
