#include "pulse/session_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pulse/errors.hpp"

using Pulse::relay::CloseCode;
using Pulse::relay::JoinResult;
using Pulse::relay::SessionRegistry;

namespace {

    // Records every frame and close request it receives.
    class FakeParticipant : public Pulse::relay::Participant {
    public:
        void deliver(const Pulse::byte_vector& frame) override {
            std::lock_guard<std::mutex> lock(mutex_);
            frames_.push_back(frame);
        }

        void disconnect(CloseCode code, const std::string& reason) override {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            close_code_ = code;
            close_reason_ = reason;
            cv_.notify_all();
        }

        std::vector<Pulse::byte_vector> frames() {
            std::lock_guard<std::mutex> lock(mutex_);
            return frames_;
        }

        bool closed() {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        bool wait_closed(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [this] { return closed_; });
        }

        CloseCode close_code() {
            std::lock_guard<std::mutex> lock(mutex_);
            return close_code_;
        }

        std::string close_reason() {
            std::lock_guard<std::mutex> lock(mutex_);
            return close_reason_;
        }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::vector<Pulse::byte_vector> frames_;
        bool closed_ = false;
        CloseCode close_code_ = CloseCode::Normal;
        std::string close_reason_;
    };

    // Manually advanced time source.
    struct ManualClock {
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);

        SessionRegistry::Clock source() {
            return [this] { return now; };
        }
    };

} // namespace

TEST(SessionRegistryTest, SecondParticipantPairsAndThirdIsRejected) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    auto c = std::make_shared<FakeParticipant>();

    ASSERT_EQ(registry.join("tok", a), JoinResult::Accepted);
    ASSERT_EQ(registry.participant_count("tok"), 1u);
    ASSERT_EQ(registry.join("tok", b), JoinResult::Accepted);
    ASSERT_EQ(registry.participant_count("tok"), 2u);

    ASSERT_EQ(registry.join("tok", c), JoinResult::RoomFull);
    ASSERT_EQ(registry.participant_count("tok"), 2u);

    // The rejected connection never receives traffic.
    registry.forward("tok", a, {1, 2, 3});
    ASSERT_TRUE(c->frames().empty());
}

TEST(SessionRegistryTest, ForwardReachesOnlyTheOtherParticipant) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    registry.join("tok", a);
    registry.join("tok", b);

    ASSERT_EQ(registry.forward("tok", a, {0xAA}), 1u);
    ASSERT_EQ(registry.forward("tok", b, {0xBB, 0xCC}), 1u);

    ASSERT_EQ(a->frames(), (std::vector<Pulse::byte_vector>{{0xBB, 0xCC}}));
    ASSERT_EQ(b->frames(), (std::vector<Pulse::byte_vector>{{0xAA}}));
}

TEST(SessionRegistryTest, FramesPreserveOrderAndBytes) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    registry.join("tok", a);
    registry.join("tok", b);

    std::vector<Pulse::byte_vector> sent;
    for (uint8_t i = 0; i < 50; ++i) {
        sent.push_back(Pulse::byte_vector(i + 1u, i));
        registry.forward("tok", a, sent.back());
    }
    ASSERT_EQ(b->frames(), sent);
}

TEST(SessionRegistryTest, LoneParticipantFramesAreDropped) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    registry.join("tok", a);

    ASSERT_EQ(registry.forward("tok", a, {1}), 0u);
    ASSERT_EQ(registry.forward("missing", a, {1}), 0u);
    ASSERT_TRUE(a->frames().empty());
}

TEST(SessionRegistryTest, SessionsAreIsolatedByToken) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    auto x = std::make_shared<FakeParticipant>();
    auto y = std::make_shared<FakeParticipant>();
    registry.join("one", a);
    registry.join("one", b);
    registry.join("two", x);
    registry.join("two", y);

    registry.forward("one", a, {1});
    ASSERT_EQ(b->frames().size(), 1u);
    ASSERT_TRUE(x->frames().empty());
    ASSERT_TRUE(y->frames().empty());
    ASSERT_EQ(registry.session_count(), 2u);
}

TEST(SessionRegistryTest, EmptySessionIsDestroyedOnLeave) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    registry.join("tok", a);
    registry.join("tok", b);

    registry.leave("tok", a);
    ASSERT_TRUE(registry.has_session("tok"));
    ASSERT_EQ(registry.participant_count("tok"), 1u);
    ASSERT_FALSE(b->closed());

    registry.leave("tok", b);
    ASSERT_FALSE(registry.has_session("tok"));
    ASSERT_EQ(registry.session_count(), 0u);

    // Unknown tokens are ignored.
    ASSERT_NO_THROW(registry.leave("tok", b));
}

TEST(SessionRegistryTest, LeaveFreesASlot) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    auto c = std::make_shared<FakeParticipant>();
    registry.join("tok", a);
    registry.join("tok", b);
    registry.leave("tok", b);

    ASSERT_EQ(registry.join("tok", c), JoinResult::Accepted);
    registry.forward("tok", c, {9});
    ASSERT_EQ(a->frames().size(), 1u);
}

TEST(SessionRegistryTest, ExpiresAfterTtlSinceCreation) {
    ManualClock clock;
    SessionRegistry registry(std::chrono::minutes(10), Pulse::ExpiryPolicy::SinceCreation, clock.source());
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    registry.join("tok", a);
    registry.join("tok", b);

    // Traffic does not extend a creation-based deadline.
    clock.now += std::chrono::minutes(9);
    registry.forward("tok", a, {1});
    clock.now += std::chrono::minutes(1);
    ASSERT_EQ(registry.sweep(), 0u);  // exactly at the TTL is not yet expired

    clock.now += std::chrono::seconds(1);
    ASSERT_EQ(registry.sweep(), 1u);
    ASSERT_FALSE(registry.has_session("tok"));

    ASSERT_TRUE(a->closed());
    ASSERT_TRUE(b->closed());
    ASSERT_EQ(a->close_code(), CloseCode::GoingAway);
    ASSERT_EQ(a->close_reason(), "session expired");
}

TEST(SessionRegistryTest, ActivityPolicyExtendsDeadline) {
    ManualClock clock;
    SessionRegistry registry(std::chrono::minutes(10), Pulse::ExpiryPolicy::SinceLastActivity, clock.source());
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    registry.join("tok", a);
    registry.join("tok", b);

    clock.now += std::chrono::minutes(9);
    registry.forward("tok", a, {1});
    clock.now += std::chrono::minutes(9);
    ASSERT_EQ(registry.sweep(), 0u);

    clock.now += std::chrono::minutes(2);
    ASSERT_EQ(registry.sweep(), 1u);
    ASSERT_TRUE(b->closed());
}

TEST(SessionRegistryTest, ExpiredConnectionCannotReachReusedToken) {
    ManualClock clock;
    SessionRegistry registry(std::chrono::minutes(10), Pulse::ExpiryPolicy::SinceCreation, clock.source());
    auto stale = std::make_shared<FakeParticipant>();
    registry.join("tok", stale);

    clock.now += std::chrono::minutes(11);
    ASSERT_EQ(registry.sweep(), 1u);

    // A new pair claims the token before the stale connection has finished closing.
    auto fresh_a = std::make_shared<FakeParticipant>();
    auto fresh_b = std::make_shared<FakeParticipant>();
    ASSERT_EQ(registry.join("tok", fresh_a), JoinResult::Accepted);
    ASSERT_EQ(registry.join("tok", fresh_b), JoinResult::Accepted);

    ASSERT_EQ(registry.forward("tok", stale, {0xDE, 0xAD}), 0u);
    ASSERT_TRUE(fresh_a->frames().empty());
    ASSERT_TRUE(fresh_b->frames().empty());

    // Its late leave does not disturb the new session either.
    registry.leave("tok", stale);
    ASSERT_EQ(registry.participant_count("tok"), 2u);
    ASSERT_EQ(registry.forward("tok", fresh_a, {1}), 1u);
}

TEST(SessionRegistryTest, SweepKeepsFreshSessions) {
    ManualClock clock;
    SessionRegistry registry(std::chrono::minutes(10), Pulse::ExpiryPolicy::SinceCreation, clock.source());
    auto old_one = std::make_shared<FakeParticipant>();
    auto fresh = std::make_shared<FakeParticipant>();

    registry.join("old", old_one);
    clock.now += std::chrono::minutes(8);
    registry.join("fresh", fresh);
    clock.now += std::chrono::minutes(3);

    ASSERT_EQ(registry.sweep(), 1u);
    ASSERT_FALSE(registry.has_session("old"));
    ASSERT_TRUE(registry.has_session("fresh"));
    ASSERT_FALSE(fresh->closed());
}

TEST(SessionRegistryTest, CloseAllDisconnectsEveryone) {
    SessionRegistry registry;
    auto a = std::make_shared<FakeParticipant>();
    auto b = std::make_shared<FakeParticipant>();
    registry.join("one", a);
    registry.join("two", b);

    registry.close_all(CloseCode::GoingAway, "Server shutdown");
    ASSERT_EQ(registry.session_count(), 0u);
    ASSERT_EQ(a->close_reason(), "Server shutdown");
    ASSERT_EQ(b->close_code(), CloseCode::GoingAway);
}

TEST(SessionRegistryTest, RejectsInvalidArguments) {
    ASSERT_THROW(SessionRegistry zero_ttl(std::chrono::milliseconds(0)), Pulse::InvalidArgument);

    SessionRegistry registry;
    ASSERT_THROW(registry.join("tok", nullptr), Pulse::InvalidArgument);
}

TEST(SessionRegistryTest, ConcurrentJoinsNeverExceedCapacity) {
    SessionRegistry registry;
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<FakeParticipant>> participants;
    for (int i = 0; i < 16; ++i) {
        participants.push_back(std::make_shared<FakeParticipant>());
    }

    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&, i] {
            if (registry.join("race", participants[i]) == JoinResult::Accepted) {
                ++accepted;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(accepted.load(), 2);
    ASSERT_EQ(registry.participant_count("race"), 2u);
}

TEST(ExpirySweeperTest, BackgroundSweepClosesExpiredSessions) {
    SessionRegistry registry(std::chrono::milliseconds(20));
    auto a = std::make_shared<FakeParticipant>();
    registry.join("tok", a);

    Pulse::relay::ExpirySweeper sweeper(registry, std::chrono::milliseconds(10));
    sweeper.start();
    ASSERT_TRUE(a->wait_closed(std::chrono::seconds(5)));
    sweeper.stop();

    ASSERT_FALSE(registry.has_session("tok"));
    ASSERT_EQ(a->close_reason(), "session expired");
}

TEST(ExpirySweeperTest, StopIsIdempotent) {
    SessionRegistry registry;
    Pulse::relay::ExpirySweeper sweeper(registry, std::chrono::minutes(1));
    sweeper.start();
    ASSERT_THROW(sweeper.start(), Pulse::LogicError);
    sweeper.stop();
    ASSERT_NO_THROW(sweeper.stop());
}
