#include "pulse/packet.hpp"
#include "pulse/errors.hpp"
#include <arpa/inet.h> // For htons, ntohs, htonl, ntohl
#include <algorithm>

// Helper for 64-bit network byte order conversion
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
static uint64_t htonll_local(uint64_t val) {
    return (((uint64_t)htonl(val)) << 32) + htonl(val >> 32);
}
static uint64_t ntohll_local(uint64_t val) {
    return (((uint64_t)ntohl(val)) << 32) + ntohl(val >> 32);
}
#else
#define htonll_local(x) (x)
#define ntohll_local(x) (x)
#endif

namespace Pulse {

namespace detail {

void append_u16(byte_vector& out, uint16_t value) {
    uint16_t be_value = htons(value);
    out.insert(out.end(), reinterpret_cast<const uint8_t*>(&be_value), reinterpret_cast<const uint8_t*>(&be_value) + sizeof(be_value));
}

uint16_t load_u16(const uint8_t* in) {
    uint16_t be_value;
    std::copy(in, in + sizeof(be_value), reinterpret_cast<uint8_t*>(&be_value));
    return ntohs(be_value);
}

} // namespace detail

// --- FieldWriter ---

FieldWriter& FieldWriter::add_bytes(const byte_vector& field) {
    if (field.size() > UINT16_MAX) {
        throw InvalidArgument("Field size exceeds maximum of 65535 bytes.");
    }
    detail::append_u16(buffer_, static_cast<uint16_t>(field.size()));
    buffer_.insert(buffer_.end(), field.begin(), field.end());
    return *this;
}

FieldWriter& FieldWriter::add_string(const std::string& field) {
    return add_bytes(byte_vector(field.begin(), field.end()));
}

FieldWriter& FieldWriter::add_u32(uint32_t field) {
    uint32_t be_field = htonl(field);
    byte_vector vec(sizeof(be_field));
    std::copy(reinterpret_cast<uint8_t*>(&be_field), reinterpret_cast<uint8_t*>(&be_field) + sizeof(be_field), vec.begin());
    return add_bytes(vec);
}

FieldWriter& FieldWriter::add_u64(uint64_t field) {
    uint64_t be_field = htonll_local(field);
    byte_vector vec(sizeof(be_field));
    std::copy(reinterpret_cast<uint8_t*>(&be_field), reinterpret_cast<uint8_t*>(&be_field) + sizeof(be_field), vec.begin());
    return add_bytes(vec);
}

byte_vector FieldWriter::build() {
    return std::move(buffer_);
}

// --- FieldReader ---

FieldReader::FieldReader(const byte_vector& data, std::size_t offset) : data_(data), offset_(offset) {}

bool FieldReader::has_more() const {
    return offset_ < data_.size();
}

byte_vector FieldReader::read_bytes() {
    if (offset_ + sizeof(uint16_t) > data_.size()) {
        throw MalformedMessageError("Invalid field data: not enough data for field length.");
    }

    uint16_t len = detail::load_u16(data_.data() + offset_);
    offset_ += sizeof(uint16_t);

    if (offset_ + len > data_.size()) {
        offset_ = data_.size(); // Prevent further reads
        throw MalformedMessageError("Invalid field data: not enough data for field content.");
    }

    byte_vector out(data_.begin() + offset_, data_.begin() + offset_ + len);
    offset_ += len;
    return out;
}

std::string FieldReader::read_string() {
    byte_vector vec = read_bytes();
    return std::string(vec.begin(), vec.end());
}

uint32_t FieldReader::read_u32() {
    byte_vector vec = read_bytes();
    if (vec.size() != sizeof(uint32_t)) {
        throw MalformedMessageError("Invalid field data: expected a 4-byte integer.");
    }
    uint32_t be_val;
    std::copy(vec.begin(), vec.end(), reinterpret_cast<uint8_t*>(&be_val));
    return ntohl(be_val);
}

uint64_t FieldReader::read_u64() {
    byte_vector vec = read_bytes();
    if (vec.size() != sizeof(uint64_t)) {
        throw MalformedMessageError("Invalid field data: expected an 8-byte integer.");
    }
    uint64_t be_val;
    std::copy(vec.begin(), vec.end(), reinterpret_cast<uint8_t*>(&be_val));
    return ntohll_local(be_val);
}

} // namespace Pulse
