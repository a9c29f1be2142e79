#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "helpers/loopback_transport.hpp"
#include "pulse/errors.hpp"
#include "pulse/receiver.hpp"
#include "pulse/sender.hpp"

namespace {

    struct RecordingSleeper {
        std::vector<std::chrono::seconds> calls;

        Pulse::Sleeper sleeper() {
            return [this](std::chrono::seconds duration) { calls.push_back(duration); };
        }
    };

} // namespace

TEST(ConnectRetryTest, GivesUpAfterConfiguredAttempts) {
    RecordingSleeper sleeps;
    std::vector<std::string> dialed;
    Pulse::Dialer refusing = [&](const std::string& url) -> std::unique_ptr<Pulse::Transport> {
        dialed.push_back(url);
        throw Pulse::TransportError("connection refused");
    };

    try {
        Pulse::dial_with_retry(refusing, "ws://relay/ws/abc", 3, sleeps.sleeper());
        FAIL() << "expected ConnectionError";
    } catch (const Pulse::ConnectionError& e) {
        ASSERT_EQ(e.cause(), "connection refused");
        ASSERT_STREQ(e.what(), "failed to connect to relay after 3 attempts: connection refused");
    }

    ASSERT_EQ(dialed.size(), 3u);
    ASSERT_EQ(sleeps.calls, (std::vector<std::chrono::seconds>{std::chrono::seconds(2), std::chrono::seconds(4)}));
}

TEST(ConnectRetryTest, StopsRetryingOnSuccess) {
    RecordingSleeper sleeps;
    int attempts = 0;
    Pulse::Dialer flaky = [&](const std::string&) -> std::unique_ptr<Pulse::Transport> {
        if (++attempts < 2) {
            throw Pulse::TransportError("temporary failure");
        }
        return std::make_unique<PulseTest::LoopbackTransport>(std::make_shared<PulseTest::Pipe>(),
                                                              std::make_shared<PulseTest::Pipe>());
    };

    auto transport = Pulse::dial_with_retry(flaky, "ws://relay/ws/abc", 3, sleeps.sleeper());
    ASSERT_TRUE(transport != nullptr);
    ASSERT_EQ(attempts, 2);
    ASSERT_EQ(sleeps.calls, (std::vector<std::chrono::seconds>{std::chrono::seconds(2)}));
}

TEST(ConnectRetryTest, SingleAttemptNeverSleeps) {
    RecordingSleeper sleeps;
    Pulse::Dialer refusing = [](const std::string&) -> std::unique_ptr<Pulse::Transport> {
        throw Pulse::TransportError("down");
    };
    ASSERT_THROW(Pulse::dial_with_retry(refusing, "ws://x", 1, sleeps.sleeper()), Pulse::ConnectionError);
    ASSERT_TRUE(sleeps.calls.empty());
    ASSERT_THROW(Pulse::dial_with_retry(refusing, "ws://x", 0, sleeps.sleeper()), Pulse::InvalidArgument);
}

TEST(ConnectRetryTest, SenderDialsTokenSocketUrl) {
    ASSERT_EQ(Pulse::Crypto::init(), 0);
    RecordingSleeper sleeps;
    std::vector<std::string> dialed;
    Pulse::Dialer refusing = [&](const std::string& url) -> std::unique_ptr<Pulse::Transport> {
        dialed.push_back(url);
        throw Pulse::TransportError("connection refused");
    };

    Pulse::TransferConfig config;
    config.relay_url = "wss://relay.example/";
    Pulse::Sender sender(config, "abc123", Pulse::Crypto::generate_key(), refusing, sleeps.sleeper());

    ASSERT_THROW(sender.connect(), Pulse::ConnectionError);
    ASSERT_EQ(sender.state(), Pulse::SenderState::Disconnected);
    ASSERT_EQ(dialed, (std::vector<std::string>(3, "wss://relay.example/ws/abc123")));
    ASSERT_EQ(sleeps.calls.size(), 2u);
}

TEST(ConnectRetryTest, ReceiverHonoursRetryCount) {
    ASSERT_EQ(Pulse::Crypto::init(), 0);
    RecordingSleeper sleeps;
    int attempts = 0;
    Pulse::Dialer refusing = [&](const std::string&) -> std::unique_ptr<Pulse::Transport> {
        ++attempts;
        throw Pulse::TransportError("connection refused");
    };

    Pulse::TransferConfig config;
    config.retries = 5;
    Pulse::Receiver receiver(config, "abc123", Pulse::Crypto::generate_key(), refusing, sleeps.sleeper());

    ASSERT_THROW(receiver.connect(), Pulse::ConnectionError);
    ASSERT_EQ(attempts, 5);
    ASSERT_EQ(sleeps.calls.back(), std::chrono::seconds(8));
}

TEST(ConfigTest, ValidateRejectsNonsense) {
    Pulse::TransferConfig config;
    ASSERT_NO_THROW(config.validate());

    config.chunk_size = 0;
    ASSERT_THROW(config.validate(), Pulse::InvalidArgument);

    config = Pulse::TransferConfig{};
    config.retries = 0;
    ASSERT_THROW(config.validate(), Pulse::InvalidArgument);

    config = Pulse::TransferConfig{};
    config.timeout = std::chrono::milliseconds(0);
    ASSERT_THROW(config.validate(), Pulse::InvalidArgument);
}

TEST(ConfigTest, RelayConfigFromEnvironment) {
    ::setenv("PORT", "9090", 1);
    ::setenv("PULSE_STATIC_DIR", "/srv/pulse", 1);
    ::setenv("PULSE_EXPIRY_POLICY", "activity", 1);
    Pulse::RelayConfig config = Pulse::RelayConfig::from_env();
    ASSERT_EQ(config.port, 9090);
    ASSERT_EQ(config.static_dir, "/srv/pulse");
    ASSERT_EQ(config.expiry_policy, Pulse::ExpiryPolicy::SinceLastActivity);
    ASSERT_EQ(config.session_ttl, std::chrono::minutes(10));

    ::setenv("PORT", "http", 1);
    ASSERT_THROW(Pulse::RelayConfig::from_env(), Pulse::InvalidArgument);
    ::setenv("PORT", "70000", 1);
    ASSERT_THROW(Pulse::RelayConfig::from_env(), Pulse::InvalidArgument);

    ::unsetenv("PORT");
    ::setenv("PULSE_EXPIRY_POLICY", "never", 1);
    ASSERT_THROW(Pulse::RelayConfig::from_env(), Pulse::InvalidArgument);

    ::unsetenv("PULSE_EXPIRY_POLICY");
    ::unsetenv("PULSE_STATIC_DIR");
    config = Pulse::RelayConfig::from_env();
    ASSERT_EQ(config.port, 8080);
    ASSERT_EQ(config.expiry_policy, Pulse::ExpiryPolicy::SinceCreation);
}
