#ifndef PULSE_CHANNEL_HPP
#define PULSE_CHANNEL_HPP

#include "crypto.hpp"
#include "message.hpp"

namespace Pulse {

    /**
     * @brief Binds one session key to the message codec.
     *
     * Every outgoing message is encoded and then encrypted under a fresh nonce;
     * every incoming frame is decrypted and then decoded. The two endpoints of a
     * transfer share the same key, so a single channel serves both directions.
     */
    class CipherChannel {
    public:
        explicit CipherChannel(SessionKey key);

        /**
         * @brief Encodes and encrypts a message into one transport frame.
         */
        EncryptedFrame seal(const Message& message) const;

        /**
         * @brief Decrypts and decodes one transport frame.
         * @throws Pulse::AuthenticationError if the frame does not verify.
         * @throws Pulse::MalformedMessageError if the plaintext is not a valid message.
         */
        Message open(const EncryptedFrame& frame) const;

        const SessionKey& key() const { return key_; }

    private:
        SessionKey key_;
    };

} // namespace Pulse

#endif // PULSE_CHANNEL_HPP
