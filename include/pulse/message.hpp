#ifndef PULSE_MESSAGE_HPP
#define PULSE_MESSAGE_HPP

#include "packet.hpp"

#include <cstdint>
#include <string>

namespace Pulse {

    /**
     * @brief Type tag leading every plaintext protocol message.
     * Format: [Type (2, big-endian)] + [Body (N)]
     */
    enum class MessageType : uint16_t {
        Ready = 0x0001,
        Metadata = 0x0002,
        Chunk = 0x0003,
        Complete = 0x0004,
        Cancel = 0x0005,
        Error = 0x0006,
    };

    const char* to_string(MessageType type);

    /**
     * @brief Describes one file before its first chunk is sent.
     */
    struct Metadata {
        std::string filename;
        uint64_t size = 0;
        uint32_t chunk_count = 0;
        std::string checksum;  // hex SHA-256 of the full plaintext
        std::string mime_type;
        uint32_t batch_index = 0;
        uint32_t batch_total = 1;

        bool operator==(const Metadata& other) const;
        bool operator!=(const Metadata& other) const { return !(*this == other); }
    };

    /**
     * @brief A single protocol message. Only the fields relevant to `type` are meaningful:
     * `metadata` for Metadata, `data` for Chunk, `reason` for Cancel and Error.
     */
    struct Message {
        MessageType type = MessageType::Ready;
        Metadata metadata;
        byte_vector data;
        std::string reason;

        static Message ready();
        static Message make_metadata(Metadata metadata);
        static Message chunk(byte_vector data);
        static Message complete();
        static Message cancel(std::string reason);
        static Message error(std::string reason);

        bool operator==(const Message& other) const;
        bool operator!=(const Message& other) const { return !(*this == other); }
    };

    /**
     * @brief Serializes a message into a single plaintext frame.
     */
    byte_vector encode(const Message& message);

    /**
     * @brief Parses a plaintext frame produced by encode().
     * @throws Pulse::MalformedMessageError on unknown tags, truncated or trailing data.
     */
    Message decode(const byte_vector& frame);

} // namespace Pulse

#endif // PULSE_MESSAGE_HPP
