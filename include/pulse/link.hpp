#ifndef PULSE_LINK_HPP
#define PULSE_LINK_HPP

#include "keys.hpp"

#include <string>

namespace Pulse {

    // Direction of the browser page a link opens.
    enum class LinkKind {
        Download,  // "/d/": the browser receives what the command line sends
        Upload,    // "/u/": the browser sends what the command line receives
    };

    /**
     * @brief WebSocket URL both endpoints dial: <relay>/ws/<token>.
     */
    std::string socket_url(const std::string& relay_url, const SessionToken& token);

    /**
     * @brief Link handed to the browser: <http(s)://host>/{d|u}/<token>#<base64 key>.
     * The key travels only in the fragment, which browsers never send to the server.
     */
    std::string share_url(const std::string& relay_url, LinkKind kind, const SessionToken& token, const SessionKey& key);

} // namespace Pulse

#endif // PULSE_LINK_HPP
