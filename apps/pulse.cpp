#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "pulse/crypto.hpp"
#include "pulse/errors.hpp"
#include "pulse/history.hpp"
#include "pulse/link.hpp"
#include "pulse/receiver.hpp"
#include "pulse/sender.hpp"
#include "pulse/ws_transport.hpp"

namespace {

Pulse::CancellationToken g_cancel;

void on_signal(int) {
    g_cancel.cancel();
}

// Installed only once the peer is connected: before that, Ctrl-C terminates as usual.
void install_signal_handlers() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

void print_usage() {
    std::cout << "Usage:\n"
              << "  pulse [flags] send <file>...\n"
              << "  pulse [flags] receive [dir]\n\n"
              << "Flags:\n"
              << "  --relay <url>       relay server (default " << Pulse::DEFAULT_RELAY_URL << ")\n"
              << "  --chunk-size <n>    chunk size in bytes (default " << Pulse::DEFAULT_CHUNK_SIZE << ")\n"
              << "  --timeout <dur>     e.g. 90s, 5m, 1h (default 5m)\n"
              << "  --retries <n>       connection attempts (default " << Pulse::DEFAULT_RETRIES << ")\n"
              << "  --debug             verbose logging\n";
}

unsigned long long parse_number(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(value, &used);
    } catch (const std::logic_error& e) {
        throw Pulse::InvalidArgument("invalid value for " + flag + ": '" + value + "' (" + e.what() + ")");
    }
    if (used != value.size() || value[0] == '-') {
        throw Pulse::InvalidArgument("invalid value for " + flag + ": '" + value + "'");
    }
    return n;
}

// Accepts a plain number of seconds or a number followed by ms, s, m or h.
std::chrono::milliseconds parse_duration(const std::string& value) {
    std::size_t split = value.find_first_not_of("0123456789");
    std::string digits = value.substr(0, split);
    std::string unit = split == std::string::npos ? "s" : value.substr(split);
    if (digits.empty()) {
        throw Pulse::InvalidArgument("invalid value for --timeout: '" + value + "'");
    }
    auto n = static_cast<long long>(parse_number("--timeout", digits));
    if (unit == "ms") return std::chrono::milliseconds(n);
    if (unit == "s") return std::chrono::seconds(n);
    if (unit == "m") return std::chrono::minutes(n);
    if (unit == "h") return std::chrono::hours(n);
    throw Pulse::InvalidArgument("invalid value for --timeout: '" + value + "'");
}

void print_progress(uint64_t done, uint64_t total) {
    constexpr int width = 40;
    int percent = total == 0 ? 100 : static_cast<int>(done * 100 / total);
    int filled = percent * width / 100;
    std::cout << "\r  [" << std::string(filled, '#') << std::string(width - filled, '.') << "] " << percent << "%"
              << std::flush;
    if (done >= total) {
        std::cout << std::endl;
    }
}

void record_history(Pulse::HistorySink& history, const Pulse::HistoryRecord& record) {
    try {
        history.record(record);
    } catch (const Pulse::RuntimeError& e) {
        spdlog::warn("Could not write history: {}", e.what());
    }
}

int run_send(const Pulse::TransferConfig& config, const std::vector<std::string>& files) {
    if (files.empty()) {
        throw Pulse::InvalidArgument("send requires at least one file");
    }
    for (const auto& file : files) {
        if (!std::filesystem::is_regular_file(file)) {
            throw Pulse::InvalidArgument("not a regular file: " + file);
        }
    }

    Pulse::SessionToken token = Pulse::Crypto::generate_token();
    Pulse::SessionKey key = Pulse::Crypto::generate_key();

    Pulse::Sender sender(config, token, key, Pulse::net::websocket_dialer());
    sender.connect();

    std::cout << "Share this link with the receiver:\n\n  "
              << Pulse::share_url(config.relay_url, Pulse::LinkKind::Download, token, key) << "\n\n"
              << "Waiting for receiver..." << std::endl;
    sender.wait_for_receiver();
    install_signal_handlers();

    Pulse::FileHistorySink history(Pulse::FileHistorySink::default_path());
    sender.send_batch(files, g_cancel, print_progress, [&](const Pulse::Metadata& metadata, const Pulse::Stats& stats) {
        std::cout << "Sent " << metadata.filename << " (" << metadata.size << " bytes in " << stats.duration.count()
                  << " ms)" << std::endl;
        record_history(history, Pulse::HistoryRecord::completed("send", metadata, stats));
    });
    sender.close();
    return 0;
}

int run_receive(const Pulse::TransferConfig& config, const std::string& dir) {
    std::filesystem::create_directories(dir);

    Pulse::SessionToken token = Pulse::Crypto::generate_token();
    Pulse::SessionKey key = Pulse::Crypto::generate_key();

    Pulse::Receiver receiver(config, token, key, Pulse::net::websocket_dialer());
    receiver.connect();

    std::cout << "Open this link to send files here:\n\n  "
              << Pulse::share_url(config.relay_url, Pulse::LinkKind::Upload, token, key) << "\n\n"
              << "Waiting for sender..." << std::endl;
    install_signal_handlers();

    Pulse::FileHistorySink history(Pulse::FileHistorySink::default_path());
    receiver.receive_batch(dir, g_cancel, print_progress, [&](const Pulse::ReceivedFile& file) {
        std::cout << "Received " << file.path.string() << " (" << file.metadata.size << " bytes, checksum verified)"
                  << std::endl;
        record_history(history, Pulse::HistoryRecord::completed("receive", file.metadata, file.stats));
    });
    receiver.close();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Pulse::TransferConfig config;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw Pulse::InvalidArgument("missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--relay") {
                config.relay_url = value();
            } else if (arg == "--chunk-size") {
                config.chunk_size = static_cast<std::size_t>(parse_number(arg, value()));
            } else if (arg == "--timeout") {
                config.timeout = parse_duration(value());
            } else if (arg == "--retries") {
                config.retries = static_cast<int>(parse_number(arg, value()));
            } else if (arg == "--debug") {
                config.debug = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else if (arg.size() > 1 && arg[0] == '-') {
                throw Pulse::InvalidArgument("unknown flag: " + arg);
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            print_usage();
            return 1;
        }

        spdlog::set_level(config.debug ? spdlog::level::debug : spdlog::level::info);

        const std::string command = positional.front();
        std::vector<std::string> args(positional.begin() + 1, positional.end());

        if (command == "send") {
            return run_send(config, args);
        }
        if (command == "receive") {
            if (args.size() > 1) {
                throw Pulse::InvalidArgument("receive takes at most one directory");
            }
            return run_receive(config, args.empty() ? "." : args.front());
        }
        throw Pulse::InvalidArgument("unknown command: " + command);
    } catch (const Pulse::InvalidArgument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage();
        return 2;
    } catch (const Pulse::CancelledError& e) {
        std::cerr << "\nCancelled: " << e.what() << std::endl;
        return 130;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
