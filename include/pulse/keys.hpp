#ifndef PULSE_KEYS_HPP
#define PULSE_KEYS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Pulse {

    // Size of the symmetric session key in bytes.
    constexpr std::size_t SESSION_KEY_BYTES = 32;

    // Number of random bytes behind a session token (hex-encoded on the wire).
    constexpr std::size_t SESSION_TOKEN_BYTES = 16;

    // The symmetric key shared out-of-band between the two endpoints.
    // Never sent to the relay.
    struct SessionKey {
        std::vector<uint8_t> data;
    };

    // Opaque identifier pairing two relay connections. Not secret.
    using SessionToken = std::string;

} // namespace Pulse

#endif // PULSE_KEYS_HPP
