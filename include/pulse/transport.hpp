#ifndef PULSE_TRANSPORT_HPP
#define PULSE_TRANSPORT_HPP

#include "packet.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace Pulse {

    /**
     * @brief One persistent, reliable, ordered, bidirectional binary connection.
     *
     * Implementations block the calling thread; receive() is always bounded by a deadline.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @brief Sends one binary frame.
         * @throws Pulse::TransportError if the connection is closed or the write fails.
         */
        virtual void send(const byte_vector& frame) = 0;

        /**
         * @brief Waits for the next binary frame.
         * @throws Pulse::TimeoutError if nothing arrives within `timeout`.
         * @throws Pulse::TransportError if the connection closed.
         */
        virtual byte_vector receive(std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Closes the connection. Safe to call more than once.
         */
        virtual void close() = 0;
    };

    // Opens a connection to a WebSocket URL; throws on failure.
    using Dialer = std::function<std::unique_ptr<Transport>(const std::string& url)>;

    // Blocks for the given backoff between connection attempts.
    using Sleeper = std::function<void(std::chrono::seconds)>;

    Sleeper default_sleeper();

    /**
     * @brief Dials `url` up to `attempts` times, sleeping (attempt_index + 1) * 2 seconds
     * between consecutive attempts.
     * @throws Pulse::ConnectionError carrying the last failure once every attempt failed.
     */
    std::unique_ptr<Transport> dial_with_retry(const Dialer& dialer,
                                               const std::string& url,
                                               int attempts,
                                               const Sleeper& sleeper);

} // namespace Pulse

#endif // PULSE_TRANSPORT_HPP
