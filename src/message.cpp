#include "pulse/message.hpp"
#include "pulse/errors.hpp"

#include <utility>

namespace Pulse {

namespace {

constexpr std::size_t TYPE_SIZE = sizeof(uint16_t);

bool is_known_type(uint16_t tag) {
    return tag >= static_cast<uint16_t>(MessageType::Ready) && tag <= static_cast<uint16_t>(MessageType::Error);
}

byte_vector encode_metadata(const Metadata& meta) {
    return FieldWriter()
        .add_string(meta.filename)
        .add_u64(meta.size)
        .add_u32(meta.chunk_count)
        .add_string(meta.checksum)
        .add_string(meta.mime_type)
        .add_u32(meta.batch_index)
        .add_u32(meta.batch_total)
        .build();
}

Metadata decode_metadata(const byte_vector& frame) {
    FieldReader reader(frame, TYPE_SIZE);
    Metadata meta;
    meta.filename = reader.read_string();
    meta.size = reader.read_u64();
    meta.chunk_count = reader.read_u32();
    meta.checksum = reader.read_string();
    meta.mime_type = reader.read_string();
    meta.batch_index = reader.read_u32();
    meta.batch_total = reader.read_u32();
    if (reader.has_more()) {
        throw MalformedMessageError("Trailing data after metadata fields.");
    }
    return meta;
}

} // namespace

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Ready: return "Ready";
        case MessageType::Metadata: return "Metadata";
        case MessageType::Chunk: return "Chunk";
        case MessageType::Complete: return "Complete";
        case MessageType::Cancel: return "Cancel";
        case MessageType::Error: return "Error";
    }
    return "Unknown";
}

bool Metadata::operator==(const Metadata& other) const {
    return filename == other.filename && size == other.size && chunk_count == other.chunk_count &&
           checksum == other.checksum && mime_type == other.mime_type && batch_index == other.batch_index &&
           batch_total == other.batch_total;
}

// --- Message ---

Message Message::ready() {
    return Message{};
}

Message Message::make_metadata(Metadata metadata) {
    Message msg;
    msg.type = MessageType::Metadata;
    msg.metadata = std::move(metadata);
    return msg;
}

Message Message::chunk(byte_vector data) {
    Message msg;
    msg.type = MessageType::Chunk;
    msg.data = std::move(data);
    return msg;
}

Message Message::complete() {
    Message msg;
    msg.type = MessageType::Complete;
    return msg;
}

Message Message::cancel(std::string reason) {
    Message msg;
    msg.type = MessageType::Cancel;
    msg.reason = std::move(reason);
    return msg;
}

Message Message::error(std::string reason) {
    Message msg;
    msg.type = MessageType::Error;
    msg.reason = std::move(reason);
    return msg;
}

bool Message::operator==(const Message& other) const {
    if (type != other.type) {
        return false;
    }
    switch (type) {
        case MessageType::Metadata: return metadata == other.metadata;
        case MessageType::Chunk: return data == other.data;
        case MessageType::Cancel:
        case MessageType::Error: return reason == other.reason;
        default: return true;
    }
}

// --- Codec ---

byte_vector encode(const Message& message) {
    byte_vector frame;
    detail::append_u16(frame, static_cast<uint16_t>(message.type));

    switch (message.type) {
        case MessageType::Ready:
        case MessageType::Complete:
            break;
        case MessageType::Metadata: {
            byte_vector body = encode_metadata(message.metadata);
            frame.insert(frame.end(), body.begin(), body.end());
            break;
        }
        case MessageType::Chunk:
            frame.insert(frame.end(), message.data.begin(), message.data.end());
            break;
        case MessageType::Cancel:
        case MessageType::Error:
            frame.insert(frame.end(), message.reason.begin(), message.reason.end());
            break;
    }
    return frame;
}

Message decode(const byte_vector& frame) {
    if (frame.size() < TYPE_SIZE) {
        throw MalformedMessageError("Frame too small to carry a message type.");
    }

    uint16_t tag = detail::load_u16(frame.data());
    if (!is_known_type(tag)) {
        throw MalformedMessageError("Unknown message type: " + std::to_string(tag));
    }

    Message msg;
    msg.type = static_cast<MessageType>(tag);
    auto body_begin = frame.begin() + TYPE_SIZE;

    switch (msg.type) {
        case MessageType::Ready:
        case MessageType::Complete:
            if (frame.size() != TYPE_SIZE) {
                throw MalformedMessageError(std::string(to_string(msg.type)) + " message must not carry a body.");
            }
            break;
        case MessageType::Metadata:
            msg.metadata = decode_metadata(frame);
            break;
        case MessageType::Chunk:
            msg.data.assign(body_begin, frame.end());
            break;
        case MessageType::Cancel:
        case MessageType::Error:
            msg.reason.assign(body_begin, frame.end());
            break;
    }
    return msg;
}

} // namespace Pulse
