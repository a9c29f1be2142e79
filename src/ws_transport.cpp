#include "pulse/ws_transport.hpp"

#include <spdlog/spdlog.h>

#include <websocketpp/uri.hpp>

#include "pulse/errors.hpp"

namespace Pulse {
    namespace net {

        namespace {

            using SslContext = websocketpp::lib::asio::ssl::context;
            using SslSocket = websocketpp::lib::asio::ssl::stream<websocketpp::lib::asio::ip::tcp::socket>;

            void configure_tls(WsClient&, const std::string&) {}

            void configure_tls(WsTlsClient& client, const std::string& host) {
                client.set_tls_init_handler([host](WsConnectionHdl) {
                    auto ctx = websocketpp::lib::make_shared<SslContext>(SslContext::tls_client);
                    ctx->set_options(SslContext::default_workarounds | SslContext::no_sslv2 | SslContext::no_sslv3);
                    ctx->set_default_verify_paths();
                    ctx->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
                    ctx->set_verify_callback(websocketpp::lib::asio::ssl::host_name_verification(host));
                    return ctx;
                });
                // Server Name Indication, required by most TLS front ends.
                client.set_socket_init_handler([host](WsConnectionHdl, SslSocket& socket) {
                    SSL_set_tlsext_host_name(socket.native_handle(), host.c_str());
                });
            }

        }  // namespace

        template <typename Endpoint>
        WsTransport<Endpoint>::WsTransport(const std::string& uri, const std::string& host) {
            client_.init_asio();
            client_.set_open_handler(std::bind(&WsTransport::on_open, this, std::placeholders::_1));
            client_.set_close_handler(std::bind(&WsTransport::on_close, this, std::placeholders::_1));
            client_.set_fail_handler(std::bind(&WsTransport::on_fail, this, std::placeholders::_1));
            client_.set_message_handler(
                std::bind(&WsTransport::on_message, this, std::placeholders::_1, std::placeholders::_2));
            client_.clear_access_channels(websocketpp::log::alevel::all);
            client_.clear_error_channels(websocketpp::log::elevel::all);
            configure_tls(client_, host);

            websocketpp::lib::error_code ec;
            typename Endpoint::connection_ptr con = client_.get_connection(uri, ec);
            if (ec) {
                throw TransportError("Could not create connection: " + ec.message());
            }
            connection_hdl_ = con->get_handle();
            client_.connect(con);

            client_thread_ = std::make_unique<std::thread>(&WsTransport::run_client, this);

            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return status_ != Status::Connecting; });
            if (status_ == Status::Closed) {
                std::string reason = close_reason_;
                lock.unlock();
                if (client_thread_->joinable()) {
                    client_thread_->join();
                }
                client_thread_.reset();
                throw TransportError("Connection failed: " + reason);
            }
        }

        template <typename Endpoint>
        WsTransport<Endpoint>::~WsTransport() {
            close();
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::send(const byte_vector& frame) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (status_ == Status::Closed) {
                    throw_closed();
                }
                if (status_ != Status::Open) {
                    throw TransportError("Connection is not open");
                }
            }

            websocketpp::lib::error_code ec;
            client_.send(connection_hdl_, frame.data(), frame.size(), BINDATA_OPCODE, ec);
            if (ec) {
                throw TransportError("Error sending frame: " + ec.message());
            }
        }

        template <typename Endpoint>
        byte_vector WsTransport<Endpoint>::receive(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, timeout, [this] { return !inbox_.empty() || status_ == Status::Closed; });

            if (!inbox_.empty()) {
                byte_vector frame = std::move(inbox_.front());
                inbox_.pop_front();
                return frame;
            }
            if (status_ == Status::Closed) {
                throw_closed();
            }
            throw TimeoutError("No frame received within " + std::to_string(timeout.count()) + "ms");
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::close() {
            // If the client thread doesn't exist, we have nothing to do.
            if (!client_thread_) {
                return;
            }

            bool is_open;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                is_open = status_ == Status::Open;
            }

            // If the connection is open, request a clean close; run() returns once it completes.
            if (is_open) {
                websocketpp::lib::error_code ec;
                client_.close(connection_hdl_, websocketpp::close::status::normal, "", ec);
                if (ec) {
                    spdlog::debug("Close request failed, stopping client: {}", ec.message());
                    client_.stop();
                }
            }

            if (client_thread_->joinable()) {
                client_thread_->join();
            }
            client_thread_.reset();
            mark_closed("closed locally");
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::on_open(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = Status::Open;
            cv_.notify_all();
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::on_close(WsConnectionHdl hdl) {
            std::string reason = "connection closed";
            uint16_t code = 0;
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(hdl, ec);
            if (!ec) {
                code = con->get_remote_close_code();
                reason = "closed by relay (" + std::to_string(code) + ")";
                if (!con->get_remote_close_reason().empty()) {
                    reason += ": " + con->get_remote_close_reason();
                }
            }
            spdlog::debug("WebSocket {}", reason);
            mark_closed(reason, code);
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::on_fail(WsConnectionHdl hdl) {
            std::string reason = "connection failed";
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(hdl, ec);
            if (!ec) {
                reason = con->get_ec().message();
            }
            mark_closed(reason);
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::on_message(WsConnectionHdl hdl, typename Endpoint::message_ptr msg) {
            if (msg->get_opcode() != BINDATA_OPCODE) {
                return;  // Ignore non-binary messages
            }

            const std::string& payload = msg->get_payload();
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.emplace_back(payload.begin(), payload.end());
            cv_.notify_all();
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::run_client() {
            try {
                client_.run();
            } catch (const std::exception& e) {
                spdlog::error("Client thread exception: {}", e.what());
                mark_closed(e.what());
            }
        }

        template <typename Endpoint>
        void WsTransport<Endpoint>::mark_closed(const std::string& reason, uint16_t close_code) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ != Status::Closed) {
                status_ = Status::Closed;
                close_reason_ = reason;
                close_code_ = close_code;
            }
            cv_.notify_all();
        }

        // Caller holds mutex_.
        template <typename Endpoint>
        void WsTransport<Endpoint>::throw_closed() const {
            if (close_code_ == websocketpp::close::status::policy_violation) {
                throw RoomFullError("Session is full: " + close_reason_);
            }
            throw TransportError("Connection closed: " + close_reason_);
        }

        template class WsTransport<WsClient>;
        template class WsTransport<WsTlsClient>;

        std::unique_ptr<Transport> dial_websocket(const std::string& url) {
            websocketpp::uri uri(url);
            if (!uri.get_valid()) {
                throw TransportError("Invalid relay URL: " + url);
            }
            if (uri.get_secure()) {
                return std::make_unique<WsTransport<WsTlsClient>>(url, uri.get_host());
            }
            return std::make_unique<WsTransport<WsClient>>(url, uri.get_host());
        }

        Dialer websocket_dialer() {
            return [](const std::string& url) { return dial_websocket(url); };
        }

    }  // namespace net
}  // namespace Pulse
