#ifndef PULSE_WS_RELAY_SERVER_HPP
#define PULSE_WS_RELAY_SERVER_HPP

#include "config.hpp"
#include "session_registry.hpp"
#include "ws_common.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace Pulse {
namespace net {

/**
 * @brief A plain HTTP answer for non-WebSocket requests.
 */
struct HttpResponse {
    int status = 404;
    std::string content_type = "text/plain; charset=utf-8";
    std::string body;
};

/**
 * @brief The blind relay: pairs WebSocket connections on /ws/<token> and forwards
 * binary frames between them without looking inside.
 */
class RelayServer {
public:
    RelayServer(RelayConfig config, std::shared_ptr<relay::SessionRegistry> registry);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /**
     * @brief Binds the configured port, starts the expiry sweeper and the I/O thread.
     * A configured port of 0 picks an ephemeral port; see port().
     */
    void run();

    /**
     * @brief Closes every connection and joins the I/O thread.
     * Handshakes that complete after this point are closed with 1001 instead of joining.
     */
    void stop();

    uint16_t port() const { return bound_port_; }

    /**
     * @brief Answers /health, /d/<token> and /u/<token>.
     */
    HttpResponse route_http(const std::string& resource) const;

    /**
     * @brief Extracts <token> from "/ws/<token>"; nullopt for any other resource.
     */
    static std::optional<SessionToken> token_from_resource(const std::string& resource);

private:
    struct Connection {
        SessionToken token;
        relay::ParticipantPtr participant;
    };

    bool on_validate(WsConnectionHdl hdl);
    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsMessagePtr msg);
    void on_http(WsConnectionHdl hdl);

    RelayConfig config_;
    std::shared_ptr<relay::SessionRegistry> registry_;
    relay::ExpirySweeper sweeper_;

    WsServer server_;
    uint16_t bound_port_ = 0;
    std::unique_ptr<std::thread> server_thread_;

    // Guards connections_ and stopping_; held across join in on_open.
    std::mutex connections_mutex_;
    std::map<WsConnectionHdl, Connection, std::owner_less<WsConnectionHdl>> connections_;
    bool stopping_ = false;
};

} // namespace net
} // namespace Pulse

#endif // PULSE_WS_RELAY_SERVER_HPP
