#include "pulse/link.hpp"

#include <gtest/gtest.h>

#include "pulse/crypto.hpp"
#include "pulse/mime.hpp"

TEST(LinkTest, SocketUrlAppendsToken) {
    ASSERT_EQ(Pulse::socket_url("wss://pulse.relay.app", "abc"), "wss://pulse.relay.app/ws/abc");
    ASSERT_EQ(Pulse::socket_url("ws://localhost:8080/", "abc"), "ws://localhost:8080/ws/abc");
}

TEST(LinkTest, ShareUrlCarriesKeyOnlyInFragment) {
    ASSERT_EQ(Pulse::Crypto::init(), 0);
    Pulse::SessionKey key;
    key.data.assign(Pulse::SESSION_KEY_BYTES, 0x00);

    std::string link = Pulse::share_url("wss://pulse.relay.app", Pulse::LinkKind::Download, "tok", key);
    ASSERT_EQ(link, "https://pulse.relay.app/d/tok#AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=");

    std::string upload = Pulse::share_url("ws://localhost:8080/", Pulse::LinkKind::Upload, "tok", key);
    ASSERT_EQ(upload.rfind("http://localhost:8080/u/tok#", 0), 0u);

    std::string fragment = link.substr(link.find('#') + 1);
    ASSERT_EQ(Pulse::Crypto::key_from_base64(fragment).data, key.data);
}

TEST(MimeTest, KnownExtensionsAreCaseInsensitive) {
    ASSERT_EQ(Pulse::mime_type_for("photo.PNG"), "image/png");
    ASSERT_EQ(Pulse::mime_type_for("notes.txt"), "text/plain; charset=utf-8");
    ASSERT_EQ(Pulse::mime_type_for("/tmp/archive.tar"), "application/x-tar");
    ASSERT_EQ(Pulse::mime_type_for("doc.pdf"), "application/pdf");
}

TEST(MimeTest, UnknownExtensionFallsBack) {
    ASSERT_EQ(Pulse::mime_type_for("binary"), Pulse::DEFAULT_MIME_TYPE);
    ASSERT_EQ(Pulse::mime_type_for("data.xyz123"), Pulse::DEFAULT_MIME_TYPE);
    ASSERT_EQ(Pulse::mime_type_for(".bashrc"), Pulse::DEFAULT_MIME_TYPE);
}
