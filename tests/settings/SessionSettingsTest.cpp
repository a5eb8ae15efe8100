#include <gtest/gtest.h>
#include "settings/SessionSettings.hpp"
#include "settings/KvSettings.hpp"
#include "settings/DbSettings.hpp"
#include <cstdlib>

using namespace websession::settings;
using namespace websession::domain;

namespace {

const char* SESSION_VARS[] = {
    "SESSION_COOKIE_NAME", "SESSION_COOKIE_PATH", "SESSION_COOKIE_DOMAIN",
    "SESSION_COOKIE_SECURE", "SESSION_COOKIE_HTTP_ONLY", "SESSION_COOKIE_SAME_SITE",
    "SESSION_TTL_SECONDS", "SESSION_SLIDING_EXPIRY", "SESSION_ID_BYTES",
    "SESSION_PERSISTENT_COOKIE", "SESSION_STORE", "SESSION_SWEEP_INTERVAL_SECONDS",
    "KV_HOST", "KV_PORT", "KV_DB", "KV_POOL_SIZE", "KV_TIMEOUT_MS", "KV_KEY_PREFIX",
    "SESSION_DB_HOST", "SESSION_DB_PORT", "SESSION_DB_NAME"
};

} // namespace

class SessionSettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    void clearEnv() {
        for (const char* name : SESSION_VARS) {
            unsetenv(name);
        }
    }
};

TEST_F(SessionSettingsTest, Defaults) {
    SessionSettings settings;
    const auto& config = settings.getConfig();

    EXPECT_EQ(config.cookieName, "sid");
    EXPECT_EQ(config.cookiePath, "/");
    EXPECT_TRUE(config.cookieDomain.empty());
    EXPECT_TRUE(config.secure);
    EXPECT_TRUE(config.httpOnly);
    EXPECT_EQ(config.sameSite, SameSite::LAX);
    EXPECT_EQ(config.ttl, std::chrono::seconds(7200));
    EXPECT_FALSE(config.slidingExpiry);
    EXPECT_EQ(config.idByteLength, 32u);
    EXPECT_EQ(settings.getStore(), "memory");
    EXPECT_EQ(settings.getSweepInterval(), std::chrono::seconds(60));
}

TEST_F(SessionSettingsTest, ReadsEnvironment) {
    setenv("SESSION_COOKIE_NAME", "app_session", 1);
    setenv("SESSION_COOKIE_SAME_SITE", "strict", 1);
    setenv("SESSION_TTL_SECONDS", "600", 1);
    setenv("SESSION_SLIDING_EXPIRY", "yes", 1);
    setenv("SESSION_COOKIE_SECURE", "FALSE", 1);
    setenv("SESSION_STORE", "redis", 1);

    SessionSettings settings;

    EXPECT_EQ(settings.getConfig().cookieName, "app_session");
    EXPECT_EQ(settings.getConfig().sameSite, SameSite::STRICT);
    EXPECT_EQ(settings.getConfig().ttl, std::chrono::seconds(600));
    EXPECT_TRUE(settings.getConfig().slidingExpiry);
    EXPECT_FALSE(settings.getConfig().secure);
    EXPECT_EQ(settings.getStore(), "redis");
}

TEST_F(SessionSettingsTest, InvalidBoolean_Throws) {
    setenv("SESSION_SLIDING_EXPIRY", "maybe", 1);
    EXPECT_THROW(SessionSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, UnknownStore_Throws) {
    setenv("SESSION_STORE", "memcached", 1);
    EXPECT_THROW(SessionSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, SameSiteNoneWithoutSecure_Throws) {
    setenv("SESSION_COOKIE_SAME_SITE", "None", 1);
    setenv("SESSION_COOKIE_SECURE", "0", 1);
    EXPECT_THROW(SessionSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, TooFewIdBytes_Throws) {
    setenv("SESSION_ID_BYTES", "8", 1);
    EXPECT_THROW(SessionSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, NegativeIdBytes_Throws) {
    setenv("SESSION_ID_BYTES", "-32", 1);
    EXPECT_THROW(SessionSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, NonNumericTtl_Throws) {
    setenv("SESSION_TTL_SECONDS", "2h", 1);
    EXPECT_THROW(SessionSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, KvSettings_OutOfRange_Throws) {
    setenv("KV_POOL_SIZE", "-1", 1);
    EXPECT_THROW(KvSettings(), std::invalid_argument);
    unsetenv("KV_POOL_SIZE");

    setenv("KV_PORT", "70000", 1);
    EXPECT_THROW(KvSettings(), std::invalid_argument);
    unsetenv("KV_PORT");

    setenv("KV_TIMEOUT_MS", "abc", 1);
    EXPECT_THROW(KvSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, DbSettings_BadPort_Throws) {
    setenv("SESSION_DB_PORT", "0", 1);
    EXPECT_THROW(DbSettings(), std::invalid_argument);
}

TEST_F(SessionSettingsTest, KvSettings_DefaultsAndOverrides) {
    {
        KvSettings kv;
        EXPECT_EQ(kv.getHost(), "redis");
        EXPECT_EQ(kv.getPort(), 6379);
        EXPECT_EQ(kv.getPoolSize(), 8u);
        EXPECT_EQ(kv.getTimeout(), std::chrono::milliseconds(500));
        EXPECT_EQ(kv.getKeyPrefix(), "session:");
    }

    setenv("KV_HOST", "localhost", 1);
    setenv("KV_PORT", "6380", 1);
    setenv("KV_KEY_PREFIX", "shop:sess:", 1);

    KvSettings kv;
    EXPECT_EQ(kv.getHost(), "localhost");
    EXPECT_EQ(kv.getPort(), 6380);
    EXPECT_EQ(kv.getKeyPrefix(), "shop:sess:");
}

TEST_F(SessionSettingsTest, DbSettings_ConnectionString) {
    setenv("SESSION_DB_HOST", "db.local", 1);
    setenv("SESSION_DB_NAME", "sessions", 1);

    DbSettings db;
    auto cs = db.getConnectionString();

    EXPECT_NE(cs.find("host=db.local"), std::string::npos);
    EXPECT_NE(cs.find("dbname=sessions"), std::string::npos);
}
