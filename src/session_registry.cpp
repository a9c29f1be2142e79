#include "pulse/session_registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "pulse/errors.hpp"

namespace Pulse {
namespace relay {

    SessionRegistry::SessionRegistry(std::chrono::milliseconds session_ttl, ExpiryPolicy policy, Clock clock)
        : session_ttl_(session_ttl), policy_(policy), clock_(std::move(clock)) {
        if (!clock_) {
            clock_ = [] { return std::chrono::steady_clock::now(); };
        }
        if (session_ttl_.count() <= 0) {
            throw InvalidArgument("Session TTL must be positive.");
        }
    }

    JoinResult SessionRegistry::join(const SessionToken& token, const ParticipantPtr& participant) {
        if (!participant) {
            throw InvalidArgument("Cannot join a session without a participant.");
        }

        const auto now = clock_();
        std::lock_guard<std::mutex> table_lock(table_mutex_);

        auto it = sessions_.find(token);
        if (it == sessions_.end()) {
            it = sessions_.emplace(token, std::make_shared<Session>(now)).first;
            spdlog::debug("Created session {}", token);
        }

        Session& session = *it->second;
        std::lock_guard<std::mutex> session_lock(session.mutex);
        if (session.participants.size() >= MAX_PARTICIPANTS) {
            spdlog::info("Rejected third participant for session {}", token);
            return JoinResult::RoomFull;
        }
        session.participants.push_back(participant);
        session.last_activity = now;
        spdlog::info("Client joined session {} ({}/{})", token, session.participants.size(), MAX_PARTICIPANTS);
        return JoinResult::Accepted;
    }

    void SessionRegistry::leave(const SessionToken& token, const ParticipantPtr& participant) {
        std::shared_ptr<Session> session = find(token);
        if (!session) {
            return;  // already expired or never joined
        }

        {
            std::lock_guard<std::mutex> session_lock(session->mutex);
            auto& members = session->participants;
            members.erase(std::remove(members.begin(), members.end(), participant), members.end());
        }

        // Re-check emptiness under both locks so a concurrent join cannot be lost.
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        auto it = sessions_.find(token);
        if (it == sessions_.end() || it->second != session) {
            return;
        }
        std::lock_guard<std::mutex> session_lock(session->mutex);
        if (session->participants.empty()) {
            sessions_.erase(it);
            spdlog::info("Session {} closed", token);
        }
    }

    std::size_t SessionRegistry::forward(const SessionToken& token,
                                         const ParticipantPtr& sender,
                                         const byte_vector& frame) {
        std::shared_ptr<Session> session = find(token);
        if (!session) {
            return 0;
        }

        std::lock_guard<std::mutex> session_lock(session->mutex);
        const auto& members = session->participants;
        if (std::find(members.begin(), members.end(), sender) == members.end()) {
            // A connection from an expired session may still be draining under a reused token.
            spdlog::debug("Dropped frame from non-member of session {}", token);
            return 0;
        }
        session->last_activity = clock_();

        std::size_t delivered = 0;
        for (const auto& member : session->participants) {
            if (member != sender) {
                member->deliver(frame);
                ++delivered;
            }
        }
        return delivered;
    }

    std::size_t SessionRegistry::sweep() {
        const auto now = clock_();
        std::size_t expired = 0;

        std::lock_guard<std::mutex> table_lock(table_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            Session& session = *it->second;
            std::lock_guard<std::mutex> session_lock(session.mutex);
            if (!is_expired(session, now)) {
                ++it;
                continue;
            }

            for (const auto& member : session.participants) {
                member->disconnect(CloseCode::GoingAway, "session expired");
            }
            session.participants.clear();
            spdlog::info("Session {} expired", it->first);
            it = sessions_.erase(it);
            ++expired;
        }
        return expired;
    }

    void SessionRegistry::close_all(CloseCode code, const std::string& reason) {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        for (auto& entry : sessions_) {
            Session& session = *entry.second;
            std::lock_guard<std::mutex> session_lock(session.mutex);
            for (const auto& member : session.participants) {
                member->disconnect(code, reason);
            }
            session.participants.clear();
        }
        sessions_.clear();
    }

    std::size_t SessionRegistry::session_count() const {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        return sessions_.size();
    }

    std::size_t SessionRegistry::participant_count(const SessionToken& token) const {
        std::shared_ptr<Session> session = find(token);
        if (!session) {
            return 0;
        }
        std::lock_guard<std::mutex> session_lock(session->mutex);
        return session->participants.size();
    }

    bool SessionRegistry::has_session(const SessionToken& token) const {
        return find(token) != nullptr;
    }

    std::shared_ptr<SessionRegistry::Session> SessionRegistry::find(const SessionToken& token) const {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        auto it = sessions_.find(token);
        return it == sessions_.end() ? nullptr : it->second;
    }

    bool SessionRegistry::is_expired(const Session& session, std::chrono::steady_clock::time_point now) const {
        const auto since = policy_ == ExpiryPolicy::SinceCreation ? session.created_at : session.last_activity;
        return now - since > session_ttl_;
    }

    // --- ExpirySweeper ---

    ExpirySweeper::ExpirySweeper(SessionRegistry& registry, std::chrono::milliseconds interval)
        : registry_(registry), interval_(interval) {
        if (interval_.count() <= 0) {
            throw InvalidArgument("Sweep interval must be positive.");
        }
    }

    ExpirySweeper::~ExpirySweeper() {
        stop();
    }

    void ExpirySweeper::start() {
        if (thread_) {
            throw LogicError("Expiry sweeper is already running.");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = false;
        }
        thread_ = std::make_unique<std::thread>(&ExpirySweeper::run, this);
    }

    void ExpirySweeper::stop() {
        if (!thread_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_->joinable()) {
            thread_->join();
        }
        thread_.reset();
    }

    void ExpirySweeper::run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
            lock.unlock();
            try {
                std::size_t expired = registry_.sweep();
                if (expired > 0) {
                    spdlog::debug("Expiry sweep removed {} session(s)", expired);
                }
            } catch (const std::exception& e) {
                spdlog::error("Expiry sweep failed: {}", e.what());
            }
            lock.lock();
        }
    }

} // namespace relay
} // namespace Pulse
