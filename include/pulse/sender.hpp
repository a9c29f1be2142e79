#ifndef PULSE_SENDER_HPP
#define PULSE_SENDER_HPP

#include "channel.hpp"
#include "config.hpp"
#include "transfer.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Pulse {

    enum class SenderState {
        Disconnected,
        Connecting,
        Connected,
        AwaitingReceiverReady,
        SendingMetadata,
        StreamingChunks,
        AwaitingAck,
        Done,
        Cancelled,
        Failed,
    };

    const char* to_string(SenderState state);

    /**
     * @brief Drives one file, or a batch sequentially, from this endpoint to the peer.
     *
     * Single-threaded: every operation blocks on the transport. Errors are fatal to the
     * file in progress; connect() is the only operation that retries.
     */
    class Sender {
    public:
        // Called after each file of a batch completes successfully.
        using FileDoneCallback = std::function<void(const Metadata&, const Stats&)>;

        Sender(TransferConfig config, SessionToken token, SessionKey key, Dialer dialer,
               Sleeper sleeper = default_sleeper());
        ~Sender();

        Sender(const Sender&) = delete;
        Sender& operator=(const Sender&) = delete;

        /**
         * @brief Opens the relay connection, retrying with backoff.
         * @throws Pulse::ConnectionError once every attempt failed.
         */
        void connect();

        /**
         * @brief Blocks until the peer announces itself with a Ready message.
         * Must succeed before any file is sent.
         * @throws Pulse::ReceiverTimeoutError if nothing arrives within `timeout`.
         * @throws Pulse::ProtocolViolationError if the first message is not Ready.
         */
        void wait_for_receiver(std::chrono::milliseconds timeout);
        void wait_for_receiver() { wait_for_receiver(config_.timeout); }

        /**
         * @brief Sends one file: Metadata, its chunks in order, then Complete.
         * @throws Pulse::UserCancelledError after sending Cancel if `cancel` was raised.
         */
        Stats send_file(const std::string& path, const CancellationToken& cancel, const ProgressCallback& progress);

        /**
         * @brief Sends several files one after another over the same connection.
         * Stops at the first failure; files already sent have been reported through `on_file_done`.
         */
        std::vector<Stats> send_batch(const std::vector<std::string>& paths,
                                      const CancellationToken& cancel,
                                      const ProgressCallback& progress,
                                      const FileDoneCallback& on_file_done = nullptr);

        void close();

        SenderState state() const { return state_; }
        const TransferConfig& config() const { return config_; }

    private:
        Stats send_one(const std::string& path,
                       uint32_t batch_index,
                       uint32_t batch_total,
                       const CancellationToken& cancel,
                       const ProgressCallback& progress,
                       Metadata& sent_metadata);
        void send_message(const Message& message);
        Transport& transport();

        TransferConfig config_;
        SessionToken token_;
        CipherChannel channel_;
        Dialer dialer_;
        Sleeper sleeper_;
        std::unique_ptr<Transport> transport_;
        SenderState state_ = SenderState::Disconnected;
        bool receiver_ready_ = false;
    };

} // namespace Pulse

#endif // PULSE_SENDER_HPP
