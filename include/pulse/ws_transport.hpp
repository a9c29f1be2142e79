#ifndef PULSE_WS_TRANSPORT_HPP
#define PULSE_WS_TRANSPORT_HPP

#include "transport.hpp"
#include "ws_common.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace Pulse {
namespace net {

/**
 * @brief Blocking Transport over a websocketpp client endpoint.
 *
 * The asio loop runs on a private thread; received binary frames are queued and handed
 * to receive() in arrival order. Instantiated for plain (ws://) and TLS (wss://) endpoints.
 */
template <typename Endpoint>
class WsTransport : public Transport {
public:
    /**
     * @brief Connects to `uri` and blocks until the WebSocket handshake finished.
     * @throws Pulse::TransportError if the connection could not be opened.
     */
    WsTransport(const std::string& uri, const std::string& host);
    ~WsTransport() override;

    /**
     * @throws Pulse::RoomFullError if the relay closed the connection with 1008.
     * @throws Pulse::TransportError if the connection is otherwise closed.
     */
    void send(const byte_vector& frame) override;
    byte_vector receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    enum class Status { Connecting, Open, Closed };

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_fail(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, typename Endpoint::message_ptr msg);
    void run_client();
    void mark_closed(const std::string& reason, uint16_t close_code = 0);
    [[noreturn]] void throw_closed() const;

    Endpoint client_;
    WsConnectionHdl connection_hdl_;
    std::unique_ptr<std::thread> client_thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    Status status_ = Status::Connecting;
    std::string close_reason_;
    uint16_t close_code_ = 0;
    std::deque<byte_vector> inbox_;
};

/**
 * @brief Opens a ws:// or wss:// connection.
 * @throws Pulse::TransportError on invalid URLs or connection failure.
 */
std::unique_ptr<Transport> dial_websocket(const std::string& url);

// Dialer suitable for Sender and Receiver.
Dialer websocket_dialer();

} // namespace net
} // namespace Pulse

#endif // PULSE_WS_TRANSPORT_HPP
