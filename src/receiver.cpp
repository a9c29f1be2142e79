#include "pulse/receiver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>

#include "pulse/errors.hpp"
#include "pulse/link.hpp"

namespace Pulse {

    namespace fs = std::filesystem;

    namespace {

        /**
         * @brief Output file written beside its destination as `<name>.part`.
         *
         * commit() renames it into place; otherwise the temporary is deleted and any
         * existing file at the destination is left untouched.
         */
        class PartialFile {
        public:
            PartialFile() = default;
            ~PartialFile() { discard(); }

            PartialFile(const PartialFile&) = delete;
            PartialFile& operator=(const PartialFile&) = delete;

            void open(const fs::path& path) {
                path_ = path;
                temp_path_ = path;
                temp_path_ += ".part";
                stream_.open(temp_path_, std::ios::binary | std::ios::trunc);
                if (!stream_) {
                    throw RuntimeError("failed to create file: " + temp_path_.string());
                }
                open_ = true;
            }

            void write(const byte_vector& data) {
                stream_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!stream_) {
                    throw RuntimeError("failed to write chunk to " + temp_path_.string());
                }
            }

            void commit() {
                stream_.close();
                if (stream_.fail()) {
                    throw RuntimeError("failed to finalize " + temp_path_.string());
                }
                std::error_code ec;
                fs::rename(temp_path_, path_, ec);
                if (ec) {
                    throw RuntimeError("failed to move " + temp_path_.string() + " into place: " + ec.message());
                }
                committed_ = true;
            }

            void discard() noexcept {
                if (!open_ || committed_) {
                    return;
                }
                stream_.close();
                std::error_code ec;
                fs::remove(temp_path_, ec);
                if (ec) {
                    spdlog::error("Failed to remove partial file {}: {}", temp_path_.string(), ec.message());
                } else {
                    spdlog::debug("Removed partial file {}", temp_path_.string());
                }
                open_ = false;
            }

            const fs::path& path() const { return path_; }

        private:
            fs::path path_;
            fs::path temp_path_;
            std::ofstream stream_;
            bool open_ = false;
            bool committed_ = false;
        };

        // Only the final path component of a peer-supplied name is ever used.
        fs::path safe_filename(const std::string& name) {
            fs::path leaf = fs::path(name).filename();
            const std::string leaf_str = leaf.string();
            if (leaf_str.empty() || leaf_str == "." || leaf_str == "..") {
                throw ProtocolViolationError("invalid filename in metadata: '" + name + "'");
            }
            return leaf;
        }

        std::string to_lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    }  // namespace

    const char* to_string(ReceiverState state) {
        switch (state) {
            case ReceiverState::Disconnected: return "Disconnected";
            case ReceiverState::Connecting: return "Connecting";
            case ReceiverState::Connected: return "Connected";
            case ReceiverState::SentReady: return "SentReady";
            case ReceiverState::AwaitingMetadata: return "AwaitingMetadata";
            case ReceiverState::ReceivingChunks: return "ReceivingChunks";
            case ReceiverState::VerifyingChecksum: return "VerifyingChecksum";
            case ReceiverState::Done: return "Done";
            case ReceiverState::Cancelled: return "Cancelled";
            case ReceiverState::Failed: return "Failed";
        }
        return "Unknown";
    }

    Receiver::Receiver(TransferConfig config, SessionToken token, SessionKey key, Dialer dialer, Sleeper sleeper)
        : config_(std::move(config)),
          token_(std::move(token)),
          channel_(std::move(key)),
          dialer_(std::move(dialer)),
          sleeper_(std::move(sleeper)) {
        config_.validate();
        if (!dialer_) {
            throw InvalidArgument("Receiver requires a dialer.");
        }
        if (Crypto::init() != 0) {
            throw RuntimeError("Failed to initialize crypto library.");
        }
    }

    Receiver::~Receiver() {
        close();
    }

    void Receiver::connect() {
        if (transport_) {
            throw LogicError("Receiver is already connected.");
        }
        state_ = ReceiverState::Connecting;
        try {
            transport_ = dial_with_retry(dialer_, socket_url(config_.relay_url, token_), config_.retries, sleeper_);
        } catch (const std::exception&) {
            state_ = ReceiverState::Disconnected;
            throw;
        }
        state_ = ReceiverState::Connected;

        try {
            transport_->send(channel_.seal(Message::ready()));
        } catch (const std::exception&) {
            state_ = ReceiverState::Failed;
            throw;
        }
        state_ = ReceiverState::SentReady;
        spdlog::debug("Receiver connected and ready");
    }

    ReceivedFile Receiver::receive_file(const fs::path& destination_dir,
                                        const CancellationToken& cancel,
                                        const ProgressCallback& progress) {
        try {
            return receive_one(destination_dir, cancel, progress);
        } catch (const CancelledError&) {
            state_ = ReceiverState::Cancelled;
            throw;
        } catch (const std::exception&) {
            state_ = ReceiverState::Failed;
            throw;
        }
    }

    std::vector<ReceivedFile> Receiver::receive_batch(const fs::path& destination_dir,
                                                      const CancellationToken& cancel,
                                                      const ProgressCallback& progress,
                                                      const FileDoneCallback& on_file_done) {
        std::vector<ReceivedFile> files;
        for (;;) {
            files.push_back(receive_file(destination_dir, cancel, progress));
            if (on_file_done) {
                on_file_done(files.back());
            }
            const Metadata& last = files.back().metadata;
            if (last.batch_index + 1 >= last.batch_total) {
                return files;
            }
        }
    }

    ReceivedFile Receiver::receive_one(const fs::path& destination_dir,
                                       const CancellationToken& cancel,
                                       const ProgressCallback& progress) {
        Transport& conn = transport();
        state_ = ReceiverState::AwaitingMetadata;

        const auto started = std::chrono::steady_clock::now();
        PartialFile file;
        Sha256Hasher hasher;
        std::optional<Metadata> metadata;
        uint64_t bytes_received = 0;

        for (;;) {
            if (cancel.is_cancelled()) {
                throw UserCancelledError("transfer cancelled by receiver");
            }

            Message msg = channel_.open(conn.receive(config_.timeout));

            switch (msg.type) {
                case MessageType::Metadata: {
                    if (metadata) {
                        throw ProtocolViolationError("received metadata twice for the same file");
                    }
                    fs::path dest = destination_dir / safe_filename(msg.metadata.filename);
                    spdlog::debug("Received metadata: {} ({} bytes, checksum: {})",
                                  msg.metadata.filename, msg.metadata.size, msg.metadata.checksum);
                    file.open(dest);
                    metadata = std::move(msg.metadata);
                    state_ = ReceiverState::ReceivingChunks;
                    break;
                }

                case MessageType::Chunk:
                    if (!metadata) {
                        throw ProtocolViolationError("received chunk before metadata");
                    }
                    if (bytes_received + msg.data.size() > metadata->size) {
                        throw ProtocolViolationError("received more data than the declared file size");
                    }
                    file.write(msg.data);
                    hasher.update(msg.data);
                    bytes_received += msg.data.size();
                    if (progress) {
                        progress(bytes_received, metadata->size);
                    }
                    break;

                case MessageType::Complete: {
                    if (!metadata) {
                        throw ProtocolViolationError("received complete before metadata");
                    }
                    state_ = ReceiverState::VerifyingChecksum;
                    if (!metadata->checksum.empty()) {
                        spdlog::debug("Verifying checksum...");
                        const std::string actual = hasher.final_hex();
                        if (actual != to_lower(metadata->checksum)) {
                            throw ChecksumMismatchError(metadata->checksum, actual);
                        }
                        spdlog::debug("Checksum verified");
                    }
                    if (bytes_received != metadata->size) {
                        throw ProtocolViolationError("transfer completed with " + std::to_string(bytes_received) +
                                                     " of " + std::to_string(metadata->size) + " bytes");
                    }
                    file.commit();

                    Stats stats = Stats::measure(started, bytes_received);
                    spdlog::debug("Transfer complete: {} bytes in {}ms ({:.0f} bytes/sec)",
                                  bytes_received, stats.duration.count(), stats.average_speed);
                    state_ = ReceiverState::Done;
                    return ReceivedFile{file.path(), stats, std::move(*metadata)};
                }

                case MessageType::Cancel:
                    throw PeerCancelledError("sender cancelled transfer: " + msg.reason);

                case MessageType::Error:
                    throw PeerReportedError("sender error: " + msg.reason);

                case MessageType::Ready:
                    throw ProtocolViolationError("unexpected Ready message from sender");
            }
        }
    }

    void Receiver::close() {
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
    }

    Transport& Receiver::transport() {
        if (!transport_) {
            throw LogicError("Receiver is not connected.");
        }
        return *transport_;
    }

}  // namespace Pulse
