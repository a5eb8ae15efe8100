/**
 * @file CookieCodecTest.cpp
 * @brief Тесты Set-Cookie / Cookie для session cookie
 */

#include <gtest/gtest.h>
#include "application/CookieCodec.hpp"

using namespace websession::application;
using namespace websession::domain;

class CookieCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.idByteLength = 16;   // токен 22 символа
        token = "AAAAAAAAAAAAAAAAAAAAAA";
    }

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    SessionConfig config;
    std::string token;
};

// ============================================================================
// encode
// ============================================================================

TEST_F(CookieCodecTest, Encode_PersistentCookie_AllAttributes) {
    config.cookieDomain = "example.com";
    CookieCodec codec(config);

    auto header = codec.encode(SessionId(token), std::chrono::seconds(3600), false);

    EXPECT_EQ(header.rfind("sid=" + token + "; Max-Age=3600; Expires=", 0), 0u);
    EXPECT_TRUE(contains(header, " GMT; Path=/; Domain=example.com; Secure; HttpOnly; SameSite=Lax"));
}

TEST_F(CookieCodecTest, Encode_SessionCookie_NoExpiry) {
    CookieCodec codec(config);

    auto header = codec.encode(SessionId(token), std::nullopt, false);

    EXPECT_EQ(header, "sid=" + token + "; Path=/; Secure; HttpOnly; SameSite=Lax");
}

TEST_F(CookieCodecTest, Encode_RespectsDisabledFlags) {
    config.secure = false;
    config.httpOnly = false;
    config.sameSite = SameSite::STRICT;
    config.cookiePath = "";
    CookieCodec codec(config);

    auto header = codec.encode(SessionId(token), std::nullopt, false);

    EXPECT_EQ(header, "sid=" + token + "; SameSite=Strict");
}

TEST_F(CookieCodecTest, Removal_EmptyValueAndPastExpiry) {
    CookieCodec codec(config);

    auto header = codec.removal();

    EXPECT_EQ(header, "sid=; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT; "
                      "Path=/; Secure; HttpOnly; SameSite=Lax");
}

TEST_F(CookieCodecTest, FormatHttpDate_ImfFixdate) {
    using namespace std::chrono;
    // 2015-10-21 07:28:00 UTC
    system_clock::time_point t{seconds{1445412480}};

    EXPECT_EQ(CookieCodec::formatHttpDate(t), "Wed, 21 Oct 2015 07:28:00 GMT");
}

// ============================================================================
// decode
// ============================================================================

TEST_F(CookieCodecTest, Decode_SingleCookie) {
    CookieCodec codec(config);

    auto id = codec.decode("sid=" + token);

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->str(), token);
}

TEST_F(CookieCodecTest, Decode_AmongOtherCookies_WithWhitespace) {
    CookieCodec codec(config);

    auto id = codec.decode("theme=dark;  sid=" + token + " ; lang=ru");

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->str(), token);
}

TEST_F(CookieCodecTest, Decode_QuotedValue) {
    CookieCodec codec(config);

    auto id = codec.decode("sid=\"" + token + "\"");

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->str(), token);
}

TEST_F(CookieCodecTest, Decode_FirstOccurrenceWins) {
    CookieCodec codec(config);
    std::string other = "BBBBBBBBBBBBBBBBBBBBBB";

    auto id = codec.decode("sid=" + token + "; sid=" + other);

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->str(), token);
}

TEST_F(CookieCodecTest, Decode_SimilarNameIsNotOurs) {
    CookieCodec codec(config);

    EXPECT_FALSE(codec.decode("xsid=" + token).has_value());
    EXPECT_FALSE(codec.decode("sidx=" + token).has_value());
}

TEST_F(CookieCodecTest, Decode_GarbageIsAbsent) {
    CookieCodec codec(config);

    EXPECT_FALSE(codec.decode("").has_value());
    EXPECT_FALSE(codec.decode("sid=").has_value());
    EXPECT_FALSE(codec.decode("sid=short").has_value());
    EXPECT_FALSE(codec.decode("sid=AAAAAAAAAA+AAAAAAAAAAA").has_value());
    EXPECT_FALSE(codec.decode(";;;===;").has_value());
}

TEST_F(CookieCodecTest, EncodeDecode_SameId) {
    CookieCodec codec(config);
    SessionId id(token);

    auto header = codec.encode(id, std::chrono::seconds(60), false);
    // Браузер отправляет обратно только name=value
    auto pair = header.substr(0, header.find(';'));

    auto decoded = codec.decode(pair);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, id);
}

TEST_F(CookieCodecTest, Constructor_ValidatesConfig) {
    config.sameSite = SameSite::NONE;
    config.secure = false;

    EXPECT_THROW(CookieCodec codec(config), std::invalid_argument);
}
