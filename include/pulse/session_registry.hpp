#ifndef PULSE_SESSION_REGISTRY_HPP
#define PULSE_SESSION_REGISTRY_HPP

#include "config.hpp"
#include "keys.hpp"
#include "packet.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Pulse {
namespace relay {

    // WebSocket close codes used by the relay.
    enum class CloseCode : uint16_t {
        Normal = 1000,
        GoingAway = 1001,
        PolicyViolation = 1008,
    };

    /**
     * @brief One connection attached to a session. The registry never inspects frames.
     */
    class Participant {
    public:
        virtual ~Participant() = default;

        // Queues one binary frame for delivery; fire-and-forget.
        virtual void deliver(const byte_vector& frame) = 0;

        // Asks the connection to close.
        virtual void disconnect(CloseCode code, const std::string& reason) = 0;
    };

    using ParticipantPtr = std::shared_ptr<Participant>;

    enum class JoinResult {
        Accepted,
        RoomFull,
    };

    /**
     * @brief Pairs at most two connections per token and forwards frames between them.
     *
     * The table lock guards insertion, lookup, removal and iteration of sessions; each
     * session's participant list has its own lock. When both are needed they are taken
     * table first, then session.
     */
    class SessionRegistry {
    public:
        using Clock = std::function<std::chrono::steady_clock::time_point()>;

        static constexpr std::size_t MAX_PARTICIPANTS = 2;

        SessionRegistry(std::chrono::milliseconds session_ttl = std::chrono::minutes(10),
                        ExpiryPolicy policy = ExpiryPolicy::SinceCreation,
                        Clock clock = nullptr);

        /**
         * @brief Adds a connection to the session for `token`, creating the session if needed.
         * @return RoomFull if the session already holds two connections; the caller closes it.
         */
        JoinResult join(const SessionToken& token, const ParticipantPtr& participant);

        /**
         * @brief Removes a connection. A session left empty is destroyed at once.
         */
        void leave(const SessionToken& token, const ParticipantPtr& participant);

        /**
         * @brief Delivers `frame` verbatim to every other participant of the session.
         * Frames from a connection that is not a member of the session are dropped.
         * @return Number of participants the frame was handed to.
         */
        std::size_t forward(const SessionToken& token, const ParticipantPtr& sender, const byte_vector& frame);

        /**
         * @brief Closes and destroys every session older than the TTL, occupied or not.
         * @return Number of sessions destroyed.
         */
        std::size_t sweep();

        /**
         * @brief Closes every participant and forgets all sessions.
         */
        void close_all(CloseCode code, const std::string& reason);

        std::size_t session_count() const;
        std::size_t participant_count(const SessionToken& token) const;
        bool has_session(const SessionToken& token) const;

    private:
        struct Session {
            explicit Session(std::chrono::steady_clock::time_point now) : created_at(now), last_activity(now) {}

            std::mutex mutex;
            std::vector<ParticipantPtr> participants;
            std::chrono::steady_clock::time_point created_at;
            std::chrono::steady_clock::time_point last_activity;
        };

        std::shared_ptr<Session> find(const SessionToken& token) const;
        bool is_expired(const Session& session, std::chrono::steady_clock::time_point now) const;

        std::chrono::milliseconds session_ttl_;
        ExpiryPolicy policy_;
        Clock clock_;

        mutable std::mutex table_mutex_;
        std::map<SessionToken, std::shared_ptr<Session>> sessions_;
    };

    /**
     * @brief Background thread calling SessionRegistry::sweep() on a fixed interval.
     */
    class ExpirySweeper {
    public:
        ExpirySweeper(SessionRegistry& registry, std::chrono::milliseconds interval);
        ~ExpirySweeper();

        ExpirySweeper(const ExpirySweeper&) = delete;
        ExpirySweeper& operator=(const ExpirySweeper&) = delete;

        void start();
        void stop();

    private:
        void run();

        SessionRegistry& registry_;
        std::chrono::milliseconds interval_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_ = false;
        std::unique_ptr<std::thread> thread_;
    };

} // namespace relay
} // namespace Pulse

#endif // PULSE_SESSION_REGISTRY_HPP
