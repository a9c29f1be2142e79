#ifndef PULSE_TRANSFER_HPP
#define PULSE_TRANSFER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace Pulse {

    /**
     * @brief Measured once per completed file.
     */
    struct Stats {
        std::chrono::milliseconds duration{0};
        uint64_t bytes_transferred = 0;
        double average_speed = 0.0;  // bytes per second

        static Stats measure(std::chrono::steady_clock::time_point started, uint64_t bytes);
    };

    // Called with (bytes done, total bytes) after every chunk.
    using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

    /**
     * @brief Cooperative cancellation flag shared between a signal source and a transfer.
     *
     * Transfers poll it at safe checkpoints; raising it never interrupts a blocking read.
     * cancel() only performs a lock-free atomic store and may be called from a signal handler.
     */
    class CancellationToken {
    public:
        void cancel() noexcept { cancelled_.store(true); }
        bool is_cancelled() const noexcept { return cancelled_.load(); }
        void reset() noexcept { cancelled_.store(false); }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace Pulse

#endif // PULSE_TRANSFER_HPP
