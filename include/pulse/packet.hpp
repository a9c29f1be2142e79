#ifndef PULSE_PACKET_HPP
#define PULSE_PACKET_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace Pulse {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    // One encrypted transport frame.
    using EncryptedFrame = byte_vector;

    namespace detail {
        void append_u16(byte_vector& out, uint16_t value);
        uint16_t load_u16(const uint8_t* in);
    }

    /**
     * @brief Appends length-prefixed fields to a buffer.
     * Field format: [Length (2, big-endian)] + [Data (Length)]
     */
    class FieldWriter {
    public:
        FieldWriter() = default;

        FieldWriter& add_bytes(const byte_vector& field);
        FieldWriter& add_string(const std::string& field);
        FieldWriter& add_u32(uint32_t field);
        FieldWriter& add_u64(uint64_t field);

        byte_vector build();

    private:
        byte_vector buffer_;
    };

    /**
     * @brief Reads length-prefixed fields written by FieldWriter.
     * Every read throws MalformedMessageError when the buffer is truncated
     * or a fixed-width field has the wrong length.
     */
    class FieldReader {
    public:
        FieldReader(const byte_vector& data, std::size_t offset = 0);

        byte_vector read_bytes();
        std::string read_string();
        uint32_t read_u32();
        uint64_t read_u64();

        bool has_more() const;

    private:
        const byte_vector& data_;
        std::size_t offset_;
    };

} // namespace Pulse

#endif // PULSE_PACKET_HPP
