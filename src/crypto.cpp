#include "pulse/crypto.hpp"

#include <atomic>

#include "pulse/errors.hpp"

namespace Pulse {

    static std::atomic<bool> g_sodium_initialized = false;

    namespace {

        std::string to_hex(const uint8_t* data, std::size_t len) {
            std::string hex(len * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), data, len);
            hex.resize(len * 2);
            return hex;
        }

        void require_key(const SessionKey& key) {
            if (key.data.size() != crypto_secretbox_KEYBYTES) {
                throw InvalidArgument("Invalid key size: expected 32 bytes.");
            }
        }

    }  // namespace

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    SessionKey Crypto::generate_key() {
        SessionKey key;
        key.data.resize(crypto_secretbox_KEYBYTES);
        crypto_secretbox_keygen(key.data.data());
        return key;
    }

    SessionToken Crypto::generate_token() {
        uint8_t raw[SESSION_TOKEN_BYTES];
        randombytes_buf(raw, sizeof(raw));
        return to_hex(raw, sizeof(raw));
    }

    EncryptedFrame Crypto::encrypt(const byte_vector& plaintext, const SessionKey& key) {
        require_key(key);

        EncryptedFrame frame(crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES + plaintext.size());
        uint8_t* nonce = frame.data();
        randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);

        crypto_secretbox_easy(frame.data() + crypto_secretbox_NONCEBYTES,
                              plaintext.data(),
                              plaintext.size(),
                              nonce,
                              key.data.data());
        return frame;
    }

    byte_vector Crypto::decrypt(const EncryptedFrame& frame, const SessionKey& key) {
        require_key(key);

        constexpr size_t HEADER_SIZE = crypto_secretbox_NONCEBYTES;
        if (frame.size() < HEADER_SIZE + crypto_secretbox_MACBYTES) {
            throw AuthenticationError("Frame too small to be valid.");
        }

        const unsigned char* ciphertext = frame.data() + HEADER_SIZE;
        size_t ciphertext_len = frame.size() - HEADER_SIZE;

        byte_vector plaintext(ciphertext_len - crypto_secretbox_MACBYTES);
        if (crypto_secretbox_open_easy(plaintext.data(), ciphertext, ciphertext_len, frame.data(), key.data.data()) != 0) {
            throw AuthenticationError("Failed to decrypt frame. Authentication tag may be invalid.");
        }
        return plaintext;
    }

    std::string Crypto::checksum(const byte_vector& data) {
        uint8_t digest[crypto_hash_sha256_BYTES];
        crypto_hash_sha256(digest, data.data(), data.size());
        return to_hex(digest, sizeof(digest));
    }

    std::string Crypto::key_to_base64(const SessionKey& key) {
        constexpr int VARIANT = sodium_base64_VARIANT_ORIGINAL;
        std::string encoded(sodium_base64_ENCODED_LEN(key.data.size(), VARIANT), '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), key.data.data(), key.data.size(), VARIANT);
        encoded.resize(encoded.size() - 1);  // drop the terminating NUL
        return encoded;
    }

    SessionKey Crypto::key_from_base64(const std::string& encoded) {
        SessionKey key;
        key.data.resize(SESSION_KEY_BYTES);
        size_t decoded_len = 0;
        if (sodium_base642bin(key.data.data(),
                              key.data.size(),
                              encoded.c_str(),
                              encoded.size(),
                              nullptr,
                              &decoded_len,
                              nullptr,
                              sodium_base64_VARIANT_ORIGINAL) != 0 ||
            decoded_len != SESSION_KEY_BYTES) {
            throw InvalidArgument("Invalid base64 session key.");
        }
        return key;
    }

    // --- Sha256Hasher ---

    Sha256Hasher::Sha256Hasher() {
        crypto_hash_sha256_init(&state_);
    }

    void Sha256Hasher::update(const uint8_t* data, std::size_t len) {
        crypto_hash_sha256_update(&state_, data, len);
    }

    std::string Sha256Hasher::final_hex() {
        uint8_t digest[crypto_hash_sha256_BYTES];
        crypto_hash_sha256_final(&state_, digest);
        crypto_hash_sha256_init(&state_);
        return to_hex(digest, sizeof(digest));
    }

}  // namespace Pulse
