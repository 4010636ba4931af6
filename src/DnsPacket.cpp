#include "DnsPacket.hpp"
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <arpa/inet.h>

namespace {
const size_t HEADER_SIZE = 12;
const size_t MAX_NAME_LENGTH = 255;
const size_t MAX_LABEL_LENGTH = 63;
const int MAX_POINTER_JUMPS = 16;
}

// Bounds-checked cursor over a received packet.
class DnsPacket::Reader {
public:
    explicit Reader(const std::vector<uint8_t>& buffer, size_t offset = 0)
        : buffer_(buffer), offset_(offset) {}

    size_t offset() const { return offset_; }

    uint8_t readUint8() {
        require(1, "uint8");
        return buffer_[offset_++];
    }

    uint16_t readUint16() {
        require(2, "uint16");
        uint16_t value = static_cast<uint16_t>((buffer_[offset_] << 8) | buffer_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    uint32_t readUint32() {
        require(4, "uint32");
        uint32_t value = (static_cast<uint32_t>(buffer_[offset_]) << 24) |
                         (static_cast<uint32_t>(buffer_[offset_ + 1]) << 16) |
                         (static_cast<uint32_t>(buffer_[offset_ + 2]) << 8) |
                         static_cast<uint32_t>(buffer_[offset_ + 3]);
        offset_ += 4;
        return value;
    }

    void skip(size_t length) {
        require(length, "record data");
        offset_ += length;
    }

    // Reads a possibly compressed name. The cursor ends up right after the
    // name as it appears at the current position, not after any pointer target.
    std::string readName() {
        std::string name;
        size_t position = offset_;
        size_t resumeAt = 0;
        bool jumped = false;
        int jumps = 0;
        size_t totalLength = 1; // terminating root label

        while (true) {
            if (position >= buffer_.size()) {
                throw std::runtime_error("Buffer overflow: name runs past end of packet");
            }
            uint8_t len = buffer_[position];

            if (len == 0) {
                position++;
                break;
            }

            if ((len & 0xC0) == 0xC0) {
                if (position + 1 >= buffer_.size()) {
                    throw std::runtime_error("Buffer overflow: incomplete compression pointer");
                }
                size_t target = (static_cast<size_t>(len & 0x3F) << 8) | buffer_[position + 1];
                if (target < HEADER_SIZE || target >= position) {
                    throw std::runtime_error("Invalid compression pointer");
                }
                if (++jumps > MAX_POINTER_JUMPS) {
                    throw std::runtime_error("Too many compression pointers");
                }
                if (!jumped) {
                    resumeAt = position + 2;
                    jumped = true;
                }
                position = target;
                continue;
            }

            if (len > MAX_LABEL_LENGTH) {
                throw std::runtime_error("Invalid name: label exceeds 63 bytes");
            }
            if (position + 1 + len > buffer_.size()) {
                throw std::runtime_error("Buffer overflow: label extends beyond packet");
            }
            totalLength += len + 1;
            if (totalLength > MAX_NAME_LENGTH) {
                throw std::runtime_error("Invalid name: exceeds 255 bytes");
            }

            if (!name.empty()) {
                name += ".";
            }
            name.append(reinterpret_cast<const char*>(&buffer_[position + 1]), len);
            position += 1 + len;
        }

        offset_ = jumped ? resumeAt : position;
        return name;
    }

    std::string readRecordData(DnsType type, uint16_t length) {
        require(length, "record data");
        size_t start = offset_;
        std::string data;

        switch (type) {
            case DnsType::A: {
                if (length != 4) {
                    throw std::runtime_error("Invalid A record length");
                }
                char ip[INET_ADDRSTRLEN];
                inet_ntop(AF_INET, &buffer_[start], ip, sizeof(ip));
                data = ip;
                break;
            }
            case DnsType::AAAA: {
                if (length != 16) {
                    throw std::runtime_error("Invalid AAAA record length");
                }
                char ip[INET6_ADDRSTRLEN];
                inet_ntop(AF_INET6, &buffer_[start], ip, sizeof(ip));
                data = ip;
                break;
            }
            case DnsType::CNAME:
            case DnsType::NS:
            case DnsType::PTR: {
                Reader target(buffer_, start);
                data = target.readName();
                break;
            }
            default: {
                char hex[3];
                for (size_t i = 0; i < length; i++) {
                    std::snprintf(hex, sizeof(hex), "%02x", buffer_[start + i]);
                    data += hex;
                }
                break;
            }
        }

        offset_ = start + length;
        return data;
    }

private:
    void require(size_t count, const char* what) const {
        if (offset_ + count > buffer_.size()) {
            throw std::runtime_error(std::string("Buffer overflow reading ") + what);
        }
    }

    const std::vector<uint8_t>& buffer_;
    size_t offset_;
};

DnsMessage DnsMessage::replyTo(const DnsMessage& query) {
    DnsMessage reply;
    reply.id = query.id;
    reply.setResponse();
    reply.setOpcode(query.getOpcode());
    if (query.recursionDesired()) {
        reply.setRecursionDesired();
    }
    reply.setRecursionAvailable();
    reply.questions = query.questions;
    return reply;
}

DnsMessage DnsMessage::queryFor(uint16_t id, const std::string& name) {
    DnsMessage query;
    query.id = id;
    query.setRecursionDesired();
    DnsQuestion question;
    question.name = name;
    question.type = DnsType::A;
    question.class_ = DnsClass::IN;
    query.questions.push_back(question);
    return query;
}

std::string DnsPacket::typeToString(DnsType type) {
    switch (type) {
        case DnsType::A: return "A";
        case DnsType::NS: return "NS";
        case DnsType::CNAME: return "CNAME";
        case DnsType::PTR: return "PTR";
        case DnsType::AAAA: return "AAAA";
    }
    return "TYPE" + std::to_string(static_cast<uint16_t>(type));
}

DnsMessage DnsPacket::decode(const std::vector<uint8_t>& buffer) {
    if (buffer.size() < HEADER_SIZE) {
        throw std::runtime_error("DNS packet too short");
    }

    Reader reader(buffer);
    DnsMessage msg;
    msg.id = reader.readUint16();
    msg.flags = reader.readUint16();
    uint16_t qdcount = reader.readUint16();
    uint16_t ancount = reader.readUint16();
    uint16_t nscount = reader.readUint16();
    uint16_t arcount = reader.readUint16();

    for (uint16_t i = 0; i < qdcount; i++) {
        DnsQuestion q;
        q.name = reader.readName();
        q.type = static_cast<DnsType>(reader.readUint16());
        q.class_ = static_cast<DnsClass>(reader.readUint16());
        msg.questions.push_back(q);
    }

    for (uint16_t i = 0; i < ancount; i++) {
        DnsAnswer a;
        a.name = reader.readName();
        a.type = static_cast<DnsType>(reader.readUint16());
        a.class_ = static_cast<DnsClass>(reader.readUint16());
        a.ttl = reader.readUint32();
        uint16_t rdlength = reader.readUint16();
        a.data = reader.readRecordData(a.type, rdlength);
        msg.answers.push_back(a);
    }

    // Authority and additional sections are only walked over
    for (uint32_t i = 0; i < static_cast<uint32_t>(nscount) + arcount; i++) {
        reader.readName();
        reader.readUint16();
        reader.readUint16();
        reader.readUint32();
        reader.skip(reader.readUint16());
    }

    return msg;
}

void DnsPacket::writeUint16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void DnsPacket::writeUint32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back((value >> 24) & 0xFF);
    buffer.push_back((value >> 16) & 0xFF);
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void DnsPacket::writeName(std::vector<uint8_t>& buffer, const std::string& name) {
    size_t encodedLength = 1;
    size_t start = 0;

    while (start < name.length()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.length();
        }
        size_t len = dot - start;
        if (len > MAX_LABEL_LENGTH) {
            throw std::runtime_error("Label too long: " + name);
        }
        // Empty labels (the trailing root dot included) are dropped
        if (len > 0) {
            encodedLength += len + 1;
            if (encodedLength > MAX_NAME_LENGTH) {
                throw std::runtime_error("Domain name too long: " + name);
            }
            buffer.push_back(static_cast<uint8_t>(len));
            buffer.insert(buffer.end(), name.begin() + start, name.begin() + dot);
        }
        start = dot + 1;
    }

    buffer.push_back(0);
}

void DnsPacket::writeRecord(std::vector<uint8_t>& buffer, const DnsAnswer& record) {
    if (record.type != DnsType::A) {
        throw std::runtime_error("Unsupported record type for encoding: " + typeToString(record.type));
    }
    struct in_addr addr;
    if (inet_pton(AF_INET, record.data.c_str(), &addr) != 1) {
        throw std::runtime_error("Invalid IPv4 address: " + record.data);
    }

    writeName(buffer, record.name);
    writeUint16(buffer, static_cast<uint16_t>(record.type));
    writeUint16(buffer, static_cast<uint16_t>(record.class_));
    writeUint32(buffer, record.ttl);
    writeUint16(buffer, 4);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&addr.s_addr);
    buffer.insert(buffer.end(), bytes, bytes + 4);
}

std::vector<uint8_t> DnsPacket::encode(const DnsMessage& message) {
    std::vector<uint8_t> buffer;
    buffer.reserve(512);

    writeUint16(buffer, message.id);
    writeUint16(buffer, message.flags);
    writeUint16(buffer, static_cast<uint16_t>(message.questions.size()));
    writeUint16(buffer, static_cast<uint16_t>(message.answers.size()));
    writeUint16(buffer, static_cast<uint16_t>(message.authority.size()));
    writeUint16(buffer, static_cast<uint16_t>(message.additional.size()));

    for (const auto& q : message.questions) {
        writeName(buffer, q.name);
        writeUint16(buffer, static_cast<uint16_t>(q.type));
        writeUint16(buffer, static_cast<uint16_t>(q.class_));
    }

    for (const auto& section : {&message.answers, &message.authority, &message.additional}) {
        for (const auto& record : *section) {
            writeRecord(buffer, record);
        }
    }

    return buffer;
}
