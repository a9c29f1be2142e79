#include "pulse/channel.hpp"
#include "pulse/errors.hpp"

namespace Pulse {

CipherChannel::CipherChannel(SessionKey key) : key_(std::move(key)) {
    if (key_.data.size() != SESSION_KEY_BYTES) {
        throw InvalidArgument("Session key must be 32 bytes.");
    }
}

EncryptedFrame CipherChannel::seal(const Message& message) const {
    return Crypto::encrypt(encode(message), key_);
}

Message CipherChannel::open(const EncryptedFrame& frame) const {
    // Authentication first: nothing reaches the decoder unless it verified.
    byte_vector plaintext = Crypto::decrypt(frame, key_);
    return decode(plaintext);
}

} // namespace Pulse
