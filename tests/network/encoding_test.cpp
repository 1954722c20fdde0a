#include "clipcloud/network/encoding.hpp"

#include <gtest/gtest.h>

using namespace clipcloud::network;

TEST(Encoding, UrlEncodeLeavesUnreservedAlone) {
    EXPECT_EQ(url_encode_component("video.mp4"), "video.mp4");
    EXPECT_EQ(url_encode_component("A-z_0~9"), "A-z_0~9");
    EXPECT_EQ(url_encode_component(""), "");
}

TEST(Encoding, UrlEncodeEscapesSeparatorsAndSpaces) {
    EXPECT_EQ(url_encode_component("my clip.mp4"), "my%20clip.mp4");
    EXPECT_EQ(url_encode_component("a/b?c"), "a%2Fb%3Fc");
    EXPECT_EQ(url_encode_component("Mythic+ run"), "Mythic%2B%20run");
    EXPECT_EQ(url_encode_component("../up"), "..%2Fup");
}

TEST(Encoding, UrlEncodeEscapesNonAscii) {
    EXPECT_EQ(url_encode_component("caf\xc3\xa9"), "caf%C3%A9");
}

TEST(Encoding, Base64Padding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Encoding, Base64KeepsHighBytes) {
    EXPECT_EQ(base64_encode(std::string("\xff\xfe\x00", 3)), "//4A");
}

TEST(Encoding, BasicAuthHeader) {
    EXPECT_EQ(basic_auth_header("Aladdin", "open sesame"), "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
}
