#ifndef PULSE_RECEIVER_HPP
#define PULSE_RECEIVER_HPP

#include "channel.hpp"
#include "config.hpp"
#include "transfer.hpp"
#include "transport.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Pulse {

    enum class ReceiverState {
        Disconnected,
        Connecting,
        Connected,
        SentReady,
        AwaitingMetadata,
        ReceivingChunks,
        VerifyingChecksum,
        Done,
        Cancelled,
        Failed,
    };

    const char* to_string(ReceiverState state);

    /**
     * @brief A file that was fully received and verified.
     */
    struct ReceivedFile {
        std::filesystem::path path;
        Stats stats;
        Metadata metadata;
    };

    /**
     * @brief Receives files announced by the peer into a destination directory.
     *
     * The file on disk is either complete and checksum-verified, or absent: data goes to
     * `<name>.part` and is renamed into place only after verification; every failure,
     * cancellation or peer abort removes the temporary.
     */
    class Receiver {
    public:
        // Called after each file of a batch was received and verified.
        using FileDoneCallback = std::function<void(const ReceivedFile&)>;

        Receiver(TransferConfig config, SessionToken token, SessionKey key, Dialer dialer,
                 Sleeper sleeper = default_sleeper());
        ~Receiver();

        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;

        /**
         * @brief Opens the relay connection and announces readiness to the peer.
         * @throws Pulse::ConnectionError once every attempt failed.
         */
        void connect();

        /**
         * @brief Receives exactly one file.
         * @throws Pulse::ProtocolViolationError on out-of-order messages.
         * @throws Pulse::ChecksumMismatchError if the content does not match the declared checksum.
         * @throws Pulse::PeerCancelledError / Pulse::PeerReportedError when the peer aborts.
         * @throws Pulse::UserCancelledError if `cancel` is raised before completion.
         */
        ReceivedFile receive_file(const std::filesystem::path& destination_dir,
                                  const CancellationToken& cancel,
                                  const ProgressCallback& progress);

        /**
         * @brief Receives files until the peer's batch is complete. Stops at the first failure.
         */
        std::vector<ReceivedFile> receive_batch(const std::filesystem::path& destination_dir,
                                                const CancellationToken& cancel,
                                                const ProgressCallback& progress,
                                                const FileDoneCallback& on_file_done = nullptr);

        void close();

        ReceiverState state() const { return state_; }
        const TransferConfig& config() const { return config_; }

    private:
        ReceivedFile receive_one(const std::filesystem::path& destination_dir,
                                 const CancellationToken& cancel,
                                 const ProgressCallback& progress);
        Transport& transport();

        TransferConfig config_;
        SessionToken token_;
        CipherChannel channel_;
        Dialer dialer_;
        Sleeper sleeper_;
        std::unique_ptr<Transport> transport_;
        ReceiverState state_ = ReceiverState::Disconnected;
    };

} // namespace Pulse

#endif // PULSE_RECEIVER_HPP
