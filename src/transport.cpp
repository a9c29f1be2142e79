#include "pulse/transport.hpp"
#include "pulse/errors.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace Pulse {

Sleeper default_sleeper() {
    return [](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); };
}

std::unique_ptr<Transport> dial_with_retry(const Dialer& dialer,
                                           const std::string& url,
                                           int attempts,
                                           const Sleeper& sleeper) {
    if (attempts <= 0) {
        throw InvalidArgument("At least one connection attempt is required.");
    }

    std::string last_error = "no attempt made";
    for (int attempt = 0; attempt < attempts; ++attempt) {
        spdlog::debug("Connect attempt {}/{} to {}", attempt + 1, attempts, url);
        try {
            std::unique_ptr<Transport> transport = dialer(url);
            if (!transport) {
                throw TransportError("dialer returned no connection");
            }
            spdlog::debug("Connected successfully");
            return transport;
        } catch (const std::exception& e) {
            last_error = e.what();
        }

        if (attempt < attempts - 1) {
            std::chrono::seconds backoff((attempt + 1) * 2);
            spdlog::debug("Connection failed, retrying in {}s: {}", backoff.count(), last_error);
            sleeper(backoff);
        }
    }

    throw ConnectionError("failed to connect to relay after " + std::to_string(attempts) + " attempts", last_error);
}

} // namespace Pulse
