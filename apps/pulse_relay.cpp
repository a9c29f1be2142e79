#include <spdlog/spdlog.h>

#include <pthread.h>
#include <signal.h>
#include <iostream>
#include <memory>

#include "pulse/config.hpp"
#include "pulse/errors.hpp"
#include "pulse/session_registry.hpp"
#include "pulse/ws_relay_server.hpp"

int main() {
    try {
        Pulse::RelayConfig config = Pulse::RelayConfig::from_env();

        // Block the shutdown signals before any thread starts so only sigwait sees them.
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
            throw Pulse::RuntimeError("Failed to block shutdown signals.");
        }

        auto registry = std::make_shared<Pulse::relay::SessionRegistry>(config.session_ttl, config.expiry_policy);
        Pulse::net::RelayServer server(config, registry);
        server.run();

        int received = 0;
        if (sigwait(&signals, &received) != 0) {
            throw Pulse::RuntimeError("sigwait failed.");
        }
        spdlog::info("Received signal {}, shutting down", received);
        server.stop();
        spdlog::info("relay stopped");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
