#include "pulse/ws_relay_server.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

#include "pulse/errors.hpp"

namespace Pulse {
    namespace net {

        namespace {

            constexpr char SOCKET_PREFIX[] = "/ws/";
            constexpr char DOWNLOAD_PREFIX[] = "/d/";
            constexpr char UPLOAD_PREFIX[] = "/u/";

            /**
             * @brief A relay participant backed by one server-side WebSocket connection.
             */
            class WsParticipant : public relay::Participant {
            public:
                WsParticipant(WsServer& server, WsConnectionHdl hdl) : server_(server), hdl_(std::move(hdl)) {}

                void deliver(const byte_vector& frame) override {
                    websocketpp::lib::error_code ec;
                    server_.send(hdl_, frame.data(), frame.size(), BINDATA_OPCODE, ec);
                    if (ec) {
                        spdlog::debug("Dropped frame for closing connection: {}", ec.message());
                    }
                }

                void disconnect(relay::CloseCode code, const std::string& reason) override {
                    websocketpp::lib::error_code ec;
                    server_.close(hdl_, static_cast<websocketpp::close::status::value>(code), reason, ec);
                    if (ec) {
                        spdlog::debug("Close failed: {}", ec.message());
                    }
                }

            private:
                WsServer& server_;
                WsConnectionHdl hdl_;
            };

            relay::SessionRegistry& checked(const std::shared_ptr<relay::SessionRegistry>& registry) {
                if (!registry) {
                    throw InvalidArgument("RelayServer requires a session registry.");
                }
                return *registry;
            }

            std::string strip_query(const std::string& resource) {
                return resource.substr(0, resource.find('?'));
            }

            bool starts_with(const std::string& s, const char* prefix) {
                return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
            }

            HttpResponse text_response(int status, const std::string& body) {
                HttpResponse response;
                response.status = status;
                response.body = body;
                return response;
            }

        }  // namespace

        RelayServer::RelayServer(RelayConfig config, std::shared_ptr<relay::SessionRegistry> registry)
            : config_(std::move(config)),
              registry_(std::move(registry)),
              sweeper_(checked(registry_), config_.sweep_interval) {
            server_.init_asio();
            server_.set_reuse_addr(true);
            server_.set_validate_handler(std::bind(&RelayServer::on_validate, this, std::placeholders::_1));
            server_.set_open_handler(std::bind(&RelayServer::on_open, this, std::placeholders::_1));
            server_.set_close_handler(std::bind(&RelayServer::on_close, this, std::placeholders::_1));
            server_.set_http_handler(std::bind(&RelayServer::on_http, this, std::placeholders::_1));
            server_.set_message_handler(
                std::bind(&RelayServer::on_message, this, std::placeholders::_1, std::placeholders::_2));
            server_.clear_access_channels(websocketpp::log::alevel::all);
            server_.clear_error_channels(websocketpp::log::elevel::all);
        }

        RelayServer::~RelayServer() {
            stop();
        }

        void RelayServer::run() {
            if (server_thread_) {
                throw LogicError("Relay server is already running.");
            }
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                stopping_ = false;
            }

            try {
                server_.listen(config_.port);
                websocketpp::lib::asio::error_code ec;
                auto endpoint = server_.get_local_endpoint(ec);
                if (ec) {
                    throw RuntimeError("Could not read local endpoint: " + ec.message());
                }
                bound_port_ = endpoint.port();
                server_.start_accept();
            } catch (const websocketpp::exception& e) {
                throw RuntimeError("Failed to listen on port " + std::to_string(config_.port) + ": " + e.what());
            }

            sweeper_.start();
            server_thread_ = std::make_unique<std::thread>([this]() {
                try {
                    server_.run();
                } catch (const std::exception& e) {
                    spdlog::error("Server thread exception: {}", e.what());
                }
            });
            spdlog::info("relay starting on :{}", bound_port_);
        }

        void RelayServer::stop() {
            sweeper_.stop();
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                stopping_ = true;
            }

            if (server_.is_listening()) {
                websocketpp::lib::error_code ec;
                server_.stop_listening(ec);
                if (ec) {
                    spdlog::warn("stop_listening failed: {}", ec.message());
                }
            }

            registry_->close_all(relay::CloseCode::GoingAway, "Server shutdown");

            if (server_thread_ && server_thread_->joinable()) {
                server_thread_->join();
            }
            server_thread_.reset();
        }

        std::optional<SessionToken> RelayServer::token_from_resource(const std::string& resource) {
            std::string path = strip_query(resource);
            if (!starts_with(path, SOCKET_PREFIX)) {
                return std::nullopt;
            }
            SessionToken token = path.substr(std::char_traits<char>::length(SOCKET_PREFIX));
            if (token.empty() || token.find('/') != std::string::npos) {
                return std::nullopt;
            }
            return token;
        }

        HttpResponse RelayServer::route_http(const std::string& resource) const {
            std::string path = strip_query(resource);

            if (path == "/health") {
                HttpResponse response;
                response.status = 200;
                response.content_type = "application/json";
                response.body = R"({"status":"ok"})";
                return response;
            }

            const char* page = nullptr;
            std::string token;
            if (starts_with(path, DOWNLOAD_PREFIX)) {
                page = "receiver.html";
                token = path.substr(std::char_traits<char>::length(DOWNLOAD_PREFIX));
            } else if (starts_with(path, UPLOAD_PREFIX)) {
                page = "sender.html";
                token = path.substr(std::char_traits<char>::length(UPLOAD_PREFIX));
            } else {
                return text_response(404, "not found");
            }

            if (token.empty()) {
                return text_response(400, "missing token");
            }
            if (config_.static_dir.empty()) {
                return text_response(404, "page not found");
            }

            std::ifstream file(config_.static_dir + "/" + page, std::ios::binary);
            if (!file) {
                return text_response(404, "page not found");
            }
            std::ostringstream content;
            content << file.rdbuf();

            HttpResponse response;
            response.status = 200;
            response.content_type = "text/html; charset=utf-8";
            response.body = content.str();
            return response;
        }

        bool RelayServer::on_validate(WsConnectionHdl hdl) {
            WsServer::connection_ptr con = server_.get_con_from_hdl(hdl);
            if (token_from_resource(con->get_resource())) {
                return true;
            }
            bool socket_path = starts_with(strip_query(con->get_resource()), SOCKET_PREFIX);
            con->set_status(socket_path ? websocketpp::http::status_code::bad_request
                                        : websocketpp::http::status_code::not_found);
            return false;
        }

        void RelayServer::on_open(WsConnectionHdl hdl) {
            WsServer::connection_ptr con = server_.get_con_from_hdl(hdl);
            std::optional<SessionToken> token = token_from_resource(con->get_resource());
            if (!token) {
                return;  // rejected by on_validate
            }

            auto participant = std::make_shared<WsParticipant>(server_, hdl);
            std::lock_guard<std::mutex> lock(connections_mutex_);
            if (stopping_) {
                participant->disconnect(relay::CloseCode::GoingAway, "Server shutdown");
                return;
            }
            if (registry_->join(*token, participant) == relay::JoinResult::RoomFull) {
                participant->disconnect(relay::CloseCode::PolicyViolation, "room full");
                return;
            }
            connections_[hdl] = Connection{*token, participant};
        }

        void RelayServer::on_close(WsConnectionHdl hdl) {
            Connection connection;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                auto it = connections_.find(hdl);
                if (it == connections_.end()) {
                    return;  // rejected connection, never joined
                }
                connection = std::move(it->second);
                connections_.erase(it);
            }
            registry_->leave(connection.token, connection.participant);
        }

        void RelayServer::on_message(WsConnectionHdl hdl, WsMessagePtr msg) {
            if (msg->get_opcode() != BINDATA_OPCODE) {
                return;  // Ignore non-binary messages
            }

            Connection connection;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                auto it = connections_.find(hdl);
                if (it == connections_.end()) {
                    return;
                }
                connection = it->second;
            }

            const std::string& payload = msg->get_payload();
            registry_->forward(connection.token, connection.participant, byte_vector(payload.begin(), payload.end()));
        }

        void RelayServer::on_http(WsConnectionHdl hdl) {
            WsServer::connection_ptr con = server_.get_con_from_hdl(hdl);
            HttpResponse response = route_http(con->get_resource());
            con->set_status(static_cast<websocketpp::http::status_code::value>(response.status));
            con->replace_header("Content-Type", response.content_type);
            con->set_body(response.body);
        }

    }  // namespace net
}  // namespace Pulse
