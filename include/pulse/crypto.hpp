#ifndef PULSE_CRYPTO_HPP
#define PULSE_CRYPTO_HPP

#include "keys.hpp"
#include "packet.hpp"

#include <sodium.h>

#include <string>

namespace Pulse {

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates a fresh random 32-byte session key.
         */
        static SessionKey generate_key();

        /**
         * @brief Generates a random session token (16 bytes, lowercase hex).
         */
        static SessionToken generate_token();

        /**
         * @brief Encrypts with XSalsa20-Poly1305 (crypto_secretbox).
         * A fresh random nonce is generated per call and prepended to the output.
         * @return [Nonce (24)] + [Ciphertext + Tag]
         */
        static EncryptedFrame encrypt(const byte_vector& plaintext, const SessionKey& key);

        /**
         * @brief Verifies and decrypts a frame produced by encrypt().
         * @throws Pulse::AuthenticationError if the frame is too short or the tag does not verify.
         */
        static byte_vector decrypt(const EncryptedFrame& frame, const SessionKey& key);

        /**
         * @brief SHA-256 of the whole input, lowercase hex.
         */
        static std::string checksum(const byte_vector& data);

        // Standard base64 with padding, as carried in the URL fragment.
        static std::string key_to_base64(const SessionKey& key);
        static SessionKey key_from_base64(const std::string& encoded);
    };

    /**
     * @brief Incremental SHA-256. Produces the same digest as Crypto::checksum over
     * the concatenation of every update().
     */
    class Sha256Hasher {
    public:
        Sha256Hasher();

        void update(const uint8_t* data, std::size_t len);
        void update(const byte_vector& data) { update(data.data(), data.size()); }

        // Finalizes the digest. The hasher is reset afterwards.
        std::string final_hex();

    private:
        crypto_hash_sha256_state state_;
    };

} // namespace Pulse

#endif // PULSE_CRYPTO_HPP
