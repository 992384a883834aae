#include "lanscan/mdns/DnsMessage.h"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace lanscan::mdns {

namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxLabelLength = 63;
constexpr int kMaxCompressionJumps = 16;
constexpr std::uint16_t kClassIn = 1;
constexpr std::uint16_t kTopBit = 0x8000;

void appendU16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
}

void appendName(std::vector<std::uint8_t>& out, const std::string& name) {
    std::size_t start = 0;
    while (start < name.size()) {
        auto dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        const auto length = dot - start;
        if (length > kMaxLabelLength) {
            throw std::invalid_argument("DNS label too long in name: " + name);
        }
        if (length > 0) {
            out.push_back(static_cast<std::uint8_t>(length));
            out.insert(out.end(), name.begin() + static_cast<std::ptrdiff_t>(start),
                       name.begin() + static_cast<std::ptrdiff_t>(dot));
        }
        start = dot + 1;
    }
    out.push_back(0);
}

class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    std::size_t offset() const noexcept { return offset_; }

    void seek(std::size_t offset) {
        if (offset > size_) {
            throw std::runtime_error("DNS record data exceeds packet length");
        }
        offset_ = offset;
    }

    void expect(std::size_t count) const {
        require(count);
    }

    std::uint8_t u8() {
        require(1);
        return data_[offset_++];
    }

    std::uint16_t u16() {
        require(2);
        const auto value = static_cast<std::uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    std::uint32_t u32() {
        const std::uint32_t high = u16();
        const std::uint32_t low = u16();
        return (high << 16) | low;
    }

    template <std::size_t N>
    std::array<std::uint8_t, N> bytes() {
        require(N);
        std::array<std::uint8_t, N> out{};
        std::copy(data_ + offset_, data_ + offset_ + N, out.begin());
        offset_ += N;
        return out;
    }

    std::string string(std::size_t length) {
        require(length);
        std::string out(reinterpret_cast<const char*>(data_ + offset_), length);
        offset_ += length;
        return out;
    }

    std::string name() {
        std::string out;
        std::size_t pos = offset_;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            if (pos >= size_) {
                throw std::runtime_error("DNS name runs past end of packet");
            }
            const std::uint8_t length = data_[pos];
            if (length == 0) {
                ++pos;
                break;
            }
            if ((length & 0xC0U) == 0xC0U) {
                if (pos + 1 >= size_) {
                    throw std::runtime_error("Truncated DNS compression pointer");
                }
                if (++jumps > kMaxCompressionJumps) {
                    throw std::runtime_error("DNS compression pointer loop");
                }
                const std::size_t target = ((length & 0x3FU) << 8) | data_[pos + 1];
                if (!jumped) {
                    offset_ = pos + 2;
                    jumped = true;
                }
                pos = target;
                continue;
            }
            if ((length & 0xC0U) != 0) {
                throw std::runtime_error("Unsupported DNS label type");
            }
            if (pos + 1 + length > size_) {
                throw std::runtime_error("DNS label runs past end of packet");
            }
            out.append(reinterpret_cast<const char*>(data_ + pos + 1), length);
            out.push_back('.');
            pos += 1 + length;
        }

        if (!jumped) {
            offset_ = pos;
        }
        return out.empty() ? std::string(".") : out;
    }

private:
    void require(std::size_t count) const {
        if (offset_ + count > size_) {
            throw std::runtime_error("Truncated DNS packet");
        }
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_{0};
};

ResourceRecord readRecord(Reader& reader) {
    ResourceRecord record;
    record.name = reader.name();
    record.type = reader.u16();
    const auto rawClass = reader.u16();
    record.cacheFlush = (rawClass & kTopBit) != 0;
    record.rrClass = static_cast<std::uint16_t>(rawClass & ~kTopBit);
    record.ttl = reader.u32();
    const auto rdLength = reader.u16();
    reader.expect(rdLength);
    const auto rdataEnd = reader.offset() + rdLength;

    if (record.is(RecordType::Ptr)) {
        record.ptrTarget = reader.name();
    } else if (record.is(RecordType::Srv)) {
        record.srv.priority = reader.u16();
        record.srv.weight = reader.u16();
        record.srv.port = reader.u16();
        record.srv.target = reader.name();
    } else if (record.is(RecordType::Txt)) {
        while (reader.offset() < rdataEnd) {
            const auto length = reader.u8();
            if (reader.offset() + length > rdataEnd) {
                throw std::runtime_error("TXT string exceeds record data");
            }
            if (length > 0) {
                record.txt.push_back(reader.string(length));
            }
        }
    } else if (record.is(RecordType::A) && rdLength == 4) {
        record.address = boost::asio::ip::address_v4(reader.bytes<4>());
    } else if (record.is(RecordType::Aaaa) && rdLength == 16) {
        record.address = boost::asio::ip::address_v6(reader.bytes<16>());
    }

    reader.seek(rdataEnd);
    return record;
}

}  // namespace

std::vector<std::uint8_t> encodeQuery(const std::vector<Question>& questions) {
    std::vector<std::uint8_t> out;
    out.reserve(kHeaderSize + questions.size() * 64);
    appendU16(out, 0);  // id
    appendU16(out, 0);  // flags: standard query
    appendU16(out, static_cast<std::uint16_t>(questions.size()));
    appendU16(out, 0);
    appendU16(out, 0);
    appendU16(out, 0);
    for (const auto& question : questions) {
        appendName(out, question.name);
        appendU16(out, static_cast<std::uint16_t>(question.type));
        appendU16(out, static_cast<std::uint16_t>(kClassIn | (question.unicastResponse ? kTopBit : 0)));
    }
    return out;
}

std::vector<std::uint8_t> encodeQuery(const std::string& name, RecordType type, bool unicastResponse) {
    return encodeQuery(std::vector<Question>{Question{name, type, unicastResponse}});
}

DnsMessage parseMessage(const std::uint8_t* data, std::size_t size) {
    if (size < kHeaderSize) {
        throw std::runtime_error("DNS packet shorter than header (" + std::to_string(size) + " bytes)");
    }

    Reader reader(data, size);
    DnsMessage message;
    message.id = reader.u16();
    message.flags = reader.u16();
    const auto questionCount = reader.u16();
    const auto answerCount = reader.u16();
    const auto authorityCount = reader.u16();
    const auto additionalCount = reader.u16();

    message.questions.reserve(questionCount);
    for (std::uint16_t i = 0; i < questionCount; ++i) {
        Question question;
        question.name = reader.name();
        question.type = static_cast<RecordType>(reader.u16());
        question.unicastResponse = (reader.u16() & kTopBit) != 0;
        message.questions.push_back(std::move(question));
    }

    const std::size_t recordCount = static_cast<std::size_t>(answerCount) + authorityCount + additionalCount;
    message.records.reserve(recordCount);
    for (std::size_t i = 0; i < recordCount; ++i) {
        message.records.push_back(readRecord(reader));
    }
    return message;
}

DnsMessage parseMessage(const std::vector<std::uint8_t>& packet) {
    return parseMessage(packet.data(), packet.size());
}

std::string canonicalName(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 1);
    for (char ch : name) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    while (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    out.push_back('.');
    return out;
}

}  // namespace lanscan::mdns
