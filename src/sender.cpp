#include "pulse/sender.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

#include "pulse/errors.hpp"
#include "pulse/link.hpp"
#include "pulse/mime.hpp"

namespace Pulse {

    const char* to_string(SenderState state) {
        switch (state) {
            case SenderState::Disconnected: return "Disconnected";
            case SenderState::Connecting: return "Connecting";
            case SenderState::Connected: return "Connected";
            case SenderState::AwaitingReceiverReady: return "AwaitingReceiverReady";
            case SenderState::SendingMetadata: return "SendingMetadata";
            case SenderState::StreamingChunks: return "StreamingChunks";
            case SenderState::AwaitingAck: return "AwaitingAck";
            case SenderState::Done: return "Done";
            case SenderState::Cancelled: return "Cancelled";
            case SenderState::Failed: return "Failed";
        }
        return "Unknown";
    }

    Sender::Sender(TransferConfig config, SessionToken token, SessionKey key, Dialer dialer, Sleeper sleeper)
        : config_(std::move(config)),
          token_(std::move(token)),
          channel_(std::move(key)),
          dialer_(std::move(dialer)),
          sleeper_(std::move(sleeper)) {
        config_.validate();
        if (!dialer_) {
            throw InvalidArgument("Sender requires a dialer.");
        }
        if (Crypto::init() != 0) {
            throw RuntimeError("Failed to initialize crypto library.");
        }
    }

    Sender::~Sender() {
        close();
    }

    void Sender::connect() {
        if (transport_) {
            throw LogicError("Sender is already connected.");
        }
        state_ = SenderState::Connecting;
        try {
            transport_ = dial_with_retry(dialer_, socket_url(config_.relay_url, token_), config_.retries, sleeper_);
        } catch (const std::exception&) {
            state_ = SenderState::Disconnected;
            throw;
        }
        state_ = SenderState::Connected;
    }

    void Sender::wait_for_receiver(std::chrono::milliseconds timeout) {
        Transport& conn = transport();
        state_ = SenderState::AwaitingReceiverReady;

        try {
            byte_vector frame;
            try {
                frame = conn.receive(timeout);
            } catch (const TimeoutError& e) {
                throw ReceiverTimeoutError(std::string("timeout waiting for receiver: ") + e.what());
            }

            Message msg = channel_.open(frame);
            if (msg.type != MessageType::Ready) {
                throw ProtocolViolationError(std::string("unexpected message type while waiting for receiver: ") +
                                             to_string(msg.type));
            }
        } catch (const std::exception&) {
            state_ = SenderState::Failed;
            throw;
        }

        spdlog::debug("Receiver ready");
        state_ = SenderState::Connected;
        receiver_ready_ = true;
    }

    Stats Sender::send_file(const std::string& path, const CancellationToken& cancel, const ProgressCallback& progress) {
        Metadata sent;
        return send_one(path, 0, 1, cancel, progress, sent);
    }

    std::vector<Stats> Sender::send_batch(const std::vector<std::string>& paths,
                                          const CancellationToken& cancel,
                                          const ProgressCallback& progress,
                                          const FileDoneCallback& on_file_done) {
        std::vector<Stats> results;
        results.reserve(paths.size());

        const auto total = static_cast<uint32_t>(paths.size());
        for (uint32_t i = 0; i < total; ++i) {
            spdlog::debug("Sending file {}/{}: {}", i + 1, total, paths[i]);
            Metadata sent;
            Stats stats = send_one(paths[i], i, total, cancel, progress, sent);
            results.push_back(stats);
            if (on_file_done) {
                on_file_done(sent, stats);
            }
        }
        return results;
    }

    Stats Sender::send_one(const std::string& path,
                           uint32_t batch_index,
                           uint32_t batch_total,
                           const CancellationToken& cancel,
                           const ProgressCallback& progress,
                           Metadata& sent_metadata) {
        Transport& conn = transport();
        if (!receiver_ready_) {
            throw LogicError("wait_for_receiver must succeed before sending files.");
        }

        try {
            const auto started = std::chrono::steady_clock::now();

            std::ifstream file(path, std::ios::binary);
            if (!file) {
                throw RuntimeError("failed to open file: " + path);
            }
            std::error_code ec;
            const uint64_t file_size = std::filesystem::file_size(path, ec);
            if (ec) {
                throw RuntimeError("failed to stat file " + path + ": " + ec.message());
            }

            // The checksum travels in Metadata, so the whole file is read before anything is sent.
            spdlog::debug("Computing checksum for {}", path);
            byte_vector buffer(config_.chunk_size);
            Sha256Hasher hasher;
            uint64_t hashed = 0;
            while (file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size())) ||
                   file.gcount() > 0) {
                hasher.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
                hashed += static_cast<uint64_t>(file.gcount());
            }
            if (file.bad() || hashed != file_size) {
                throw RuntimeError("failed to read file for checksum: " + path);
            }
            file.clear();
            file.seekg(0);

            Metadata meta;
            meta.filename = std::filesystem::path(path).filename().string();
            meta.size = file_size;
            meta.chunk_count = static_cast<uint32_t>((file_size + config_.chunk_size - 1) / config_.chunk_size);
            meta.checksum = hasher.final_hex();
            meta.mime_type = mime_type_for(path);
            meta.batch_index = batch_index;
            meta.batch_total = batch_total;
            spdlog::debug("Checksum: {}", meta.checksum);

            state_ = SenderState::SendingMetadata;
            send_message(Message::make_metadata(meta));

            state_ = SenderState::StreamingChunks;
            uint64_t bytes_sent = 0;
            for (;;) {
                if (cancel.is_cancelled()) {
                    try {
                        send_message(Message::cancel("cancelled by sender"));
                    } catch (const TransportError& e) {
                        spdlog::warn("Could not notify receiver of cancellation: {}", e.what());
                    }
                    throw UserCancelledError("transfer cancelled by sender");
                }

                file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                const auto n = static_cast<std::size_t>(file.gcount());
                if (file.bad()) {
                    throw RuntimeError("failed to read file: " + path);
                }
                if (n == 0) {
                    break;
                }

                send_message(Message::chunk(byte_vector(buffer.begin(), buffer.begin() + n)));
                bytes_sent += n;
                if (progress) {
                    progress(bytes_sent, file_size);
                }
            }

            if (bytes_sent != file_size) {
                throw RuntimeError("file changed while sending: " + path);
            }

            state_ = SenderState::AwaitingAck;
            send_message(Message::complete());

            Stats stats = Stats::measure(started, bytes_sent);
            spdlog::debug("Transfer complete: {} bytes in {}ms ({:.0f} bytes/sec)",
                          bytes_sent, stats.duration.count(), stats.average_speed);

            state_ = SenderState::Done;
            sent_metadata = std::move(meta);
            return stats;
        } catch (const CancelledError&) {
            state_ = SenderState::Cancelled;
            throw;
        } catch (const TransportError&) {
            state_ = SenderState::Failed;
            throw;
        } catch (const std::exception& e) {
            state_ = SenderState::Failed;
            // Best effort; the receiver discards its partial file on Error.
            try {
                send_message(Message::error(e.what()));
            } catch (const TransportError& notify_error) {
                spdlog::warn("Could not notify receiver of failure: {}", notify_error.what());
            }
            throw;
        }
    }

    void Sender::close() {
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
        receiver_ready_ = false;
    }

    void Sender::send_message(const Message& message) {
        transport().send(channel_.seal(message));
    }

    Transport& Sender::transport() {
        if (!transport_) {
            throw LogicError("Sender is not connected.");
        }
        return *transport_;
    }

}  // namespace Pulse
