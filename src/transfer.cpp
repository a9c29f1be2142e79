#include "pulse/transfer.hpp"

namespace Pulse {

Stats Stats::measure(std::chrono::steady_clock::time_point started, uint64_t bytes) {
    auto elapsed = std::chrono::steady_clock::now() - started;

    Stats stats;
    stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    stats.bytes_transferred = bytes;

    double seconds = std::chrono::duration<double>(elapsed).count();
    stats.average_speed = seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;
    return stats;
}

} // namespace Pulse
