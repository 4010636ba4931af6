#pragma once

#include <string>
#include <vector>
#include <cstdint>

enum class DnsType : uint16_t {
    A = 1,
    NS = 2,
    CNAME = 5,
    PTR = 12,
    AAAA = 28
};

enum class DnsClass : uint16_t {
    IN = 1
};

enum class DnsOpcode : uint8_t {
    QUERY = 0
};

// TTL written on answers that do not carry one of their own.
constexpr uint32_t DEFAULT_ANSWER_TTL = 3600;

struct DnsQuestion {
    std::string name;
    DnsType type = DnsType::A;
    DnsClass class_ = DnsClass::IN;
};

struct DnsAnswer {
    std::string name;
    DnsType type = DnsType::A;
    DnsClass class_ = DnsClass::IN;
    uint32_t ttl = DEFAULT_ANSWER_TTL;
    std::string data;
};

struct DnsMessage {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<DnsQuestion> questions;
    std::vector<DnsAnswer> answers;
    std::vector<DnsAnswer> authority;
    std::vector<DnsAnswer> additional;

    bool isResponse() const { return (flags & 0x8000) != 0; }
    void setResponse() { flags |= 0x8000; }
    uint8_t getOpcode() const { return (flags >> 11) & 0x0F; }
    void setOpcode(uint8_t opcode) { flags = (flags & 0x87FF) | ((opcode & 0x0F) << 11); }
    bool recursionDesired() const { return (flags & 0x0100) != 0; }
    void setRecursionDesired() { flags |= 0x0100; }
    void setRecursionAvailable() { flags |= 0x0080; }
    bool isTruncated() const { return (flags & 0x0200) != 0; }
    uint8_t getRCode() const { return flags & 0x000F; }
    void setRCode(uint8_t rcode) { flags = (flags & 0xFFF0) | (rcode & 0x000F); }

    // Builds the skeleton of a reply: same id and opcode, RD copied,
    // questions echoed, QR and RA set, NOERROR.
    static DnsMessage replyTo(const DnsMessage& query);

    // A recursive type-A/IN query for one name.
    static DnsMessage queryFor(uint16_t id, const std::string& name);
};

class DnsPacket {
public:
    // Throws std::runtime_error on truncated or malformed input. Authority
    // and additional records are skipped.
    static DnsMessage decode(const std::vector<uint8_t>& buffer);

    // Only A records can be encoded in the record sections.
    static std::vector<uint8_t> encode(const DnsMessage& message);

    static std::string typeToString(DnsType type);

private:
    class Reader;

    static void writeName(std::vector<uint8_t>& buffer, const std::string& name);
    static void writeRecord(std::vector<uint8_t>& buffer, const DnsAnswer& record);
    static void writeUint16(std::vector<uint8_t>& buffer, uint16_t value);
    static void writeUint32(std::vector<uint8_t>& buffer, uint32_t value);
};
