#ifndef PULSE_WS_COMMON_HPP
#define PULSE_WS_COMMON_HPP

#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/server.hpp>
#include <websocketpp/client.hpp>

namespace Pulse {
namespace net {

    // Define types for convenience
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;
    using WsTlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
    using WsConnectionHdl = websocketpp::connection_hdl;
    using WsMessagePtr = WsServer::message_ptr;

    // Define a common binary message type for websocketpp
    const websocketpp::frame::opcode::value BINDATA_OPCODE = websocketpp::frame::opcode::binary;

} // namespace net
} // namespace Pulse

#endif // PULSE_WS_COMMON_HPP
