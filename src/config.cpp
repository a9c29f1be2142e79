#include "pulse/config.hpp"
#include "pulse/errors.hpp"

#include <cstdlib>

namespace Pulse {

void TransferConfig::validate() const {
    if (chunk_size == 0) {
        throw InvalidArgument("Chunk size must be positive.");
    }
    if (timeout.count() <= 0) {
        throw InvalidArgument("Timeout must be positive.");
    }
    if (retries <= 0) {
        throw InvalidArgument("Retry count must be positive.");
    }
}

RelayConfig RelayConfig::from_env() {
    RelayConfig config;

    if (const char* port = std::getenv("PORT"); port != nullptr && *port != '\0') {
        unsigned long value = 0;
        try {
            value = std::stoul(port);
        } catch (const std::exception&) {
            throw InvalidArgument(std::string("Invalid PORT: ") + port);
        }
        if (value == 0 || value > UINT16_MAX) {
            throw InvalidArgument(std::string("PORT out of range: ") + port);
        }
        config.port = static_cast<uint16_t>(value);
    }

    if (const char* dir = std::getenv("PULSE_STATIC_DIR"); dir != nullptr) {
        config.static_dir = dir;
    }

    if (const char* policy = std::getenv("PULSE_EXPIRY_POLICY"); policy != nullptr && *policy != '\0') {
        std::string value(policy);
        if (value == "creation") {
            config.expiry_policy = ExpiryPolicy::SinceCreation;
        } else if (value == "activity") {
            config.expiry_policy = ExpiryPolicy::SinceLastActivity;
        } else {
            throw InvalidArgument("Invalid PULSE_EXPIRY_POLICY: " + value);
        }
    }

    return config;
}

} // namespace Pulse
