#ifndef PULSE_CONFIG_HPP
#define PULSE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Pulse {

    constexpr char DEFAULT_RELAY_URL[] = "wss://pulse.relay.app";
    constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
    constexpr std::chrono::milliseconds DEFAULT_TIMEOUT = std::chrono::minutes(5);
    constexpr int DEFAULT_RETRIES = 3;

    /**
     * @brief Endpoint settings, normally filled from command-line flags.
     */
    struct TransferConfig {
        std::string relay_url = DEFAULT_RELAY_URL;
        std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
        // Applies to waiting for the receiver and to every individual read.
        std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
        int retries = DEFAULT_RETRIES;
        bool debug = false;

        // Throws Pulse::InvalidArgument on a zero chunk size, timeout or retry count.
        void validate() const;
    };

    /**
     * @brief How the relay measures the age of a session for expiry.
     */
    enum class ExpiryPolicy {
        SinceCreation,      // fixed ceiling from the first join, regardless of traffic
        SinceLastActivity,  // ceiling measured from the last join or forwarded frame
    };

    struct RelayConfig {
        uint16_t port = 8080;
        std::chrono::milliseconds session_ttl = std::chrono::minutes(10);
        std::chrono::milliseconds sweep_interval = std::chrono::minutes(1);
        ExpiryPolicy expiry_policy = ExpiryPolicy::SinceCreation;
        // Directory holding receiver.html and sender.html. Empty disables the pages.
        std::string static_dir;

        /**
         * @brief Reads PORT, PULSE_STATIC_DIR and PULSE_EXPIRY_POLICY
         * ("creation" or "activity") on top of the defaults.
         * @throws Pulse::InvalidArgument on unparsable values.
         */
        static RelayConfig from_env();
    };

} // namespace Pulse

#endif // PULSE_CONFIG_HPP
