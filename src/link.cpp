#include "pulse/link.hpp"
#include "pulse/crypto.hpp"

namespace Pulse {

namespace {

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string replace_prefix(const std::string& url, const std::string& from, const std::string& to) {
    if (url.compare(0, from.size(), from) == 0) {
        return to + url.substr(from.size());
    }
    return url;
}

} // namespace

std::string socket_url(const std::string& relay_url, const SessionToken& token) {
    return trim_trailing_slash(relay_url) + "/ws/" + token;
}

std::string share_url(const std::string& relay_url, LinkKind kind, const SessionToken& token, const SessionKey& key) {
    std::string base = trim_trailing_slash(relay_url);
    base = replace_prefix(base, "wss://", "https://");
    base = replace_prefix(base, "ws://", "http://");

    const char* route = kind == LinkKind::Download ? "/d/" : "/u/";
    return base + route + token + "#" + Crypto::key_to_base64(key);
}

} // namespace Pulse
