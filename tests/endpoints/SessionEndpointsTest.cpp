/**
 * @file SessionEndpointsTest.cpp
 * @brief HTTP уровень: SessionHttpMiddleware + session handlers
 *
 * Браузер эмулируется вручную: Set-Cookie из ответа превращается
 * в заголовок Cookie следующего запроса.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/SessionHttpMiddleware.hpp"
#include "adapters/primary/SessionLoginHandler.hpp"
#include "adapters/primary/SessionLogoutHandler.hpp"
#include "adapters/primary/VisitCounterHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/secondary/MemorySessionStore.hpp"
#include "mocks/MockSessionStore.hpp"
#include "mocks/SequenceRandomSource.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

#include <chrono>

using namespace websession;
using namespace websession::adapters::primary;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Throw;

// ============================================================================
// Handler, пишущий в сессию строку не в UTF-8
// ============================================================================

class InvalidUtf8Handler : public ISessionHandler {
public:
    void handle(IRequest&, IResponse& res, application::SessionHandle& session) override {
        session.set("name", std::string("caf\xe9"));
        res.setResult(200, "application/json", R"({"ok":true})");
    }
};

// ============================================================================
// Test Fixture
// ============================================================================

class SessionEndpointsTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::MemorySessionStore>(1h);
        random_ = std::make_shared<tests::SequenceRandomSource>();
        sessions_ = std::make_shared<application::SessionMiddleware>(store_, random_, config_);

        visits_ = std::make_unique<SessionHttpMiddleware>(sessions_, std::make_shared<VisitCounterHandler>());
        login_ = std::make_unique<SessionHttpMiddleware>(sessions_, std::make_shared<SessionLoginHandler>());
        logout_ = std::make_unique<SessionHttpMiddleware>(sessions_, std::make_shared<SessionLogoutHandler>());
    }

    SimpleRequest createRequest(const std::string& method,
                                const std::string& path,
                                const std::string& body = "") {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        if (!cookie_.empty()) {
            req.setHeader("Cookie", cookie_);
        }
        return req;
    }

    /// Запомнить cookie так, как это сделал бы браузер
    void rememberCookie(SimpleResponse& res) {
        auto setCookie = res.getHeader("Set-Cookie");
        if (!setCookie) return;
        auto pair = setCookie->substr(0, setCookie->find(';'));
        cookie_ = (pair == "sid=") ? "" : pair;
    }

    SimpleResponse send(IHttpHandler& handler, const std::string& method,
                        const std::string& path, const std::string& body = "") {
        auto req = createRequest(method, path, body);
        SimpleResponse res;
        handler.handle(req, res);
        rememberCookie(res);
        return res;
    }

    nlohmann::json parseJson(const std::string& body) {
        return nlohmann::json::parse(body);
    }

    domain::SessionConfig config_;
    std::shared_ptr<adapters::secondary::MemorySessionStore> store_;
    std::shared_ptr<tests::SequenceRandomSource> random_;
    std::shared_ptr<application::SessionMiddleware> sessions_;
    std::unique_ptr<SessionHttpMiddleware> visits_;
    std::unique_ptr<SessionHttpMiddleware> login_;
    std::unique_ptr<SessionHttpMiddleware> logout_;
    std::string cookie_;
};

// ============================================================================
// VISITS
// ============================================================================

TEST_F(SessionEndpointsTest, FirstVisit_SetsCookie) {
    auto res = send(*visits_, "GET", "/api/v1/session/visits");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["visits"], 1);

    auto setCookie = res.getHeader("Set-Cookie");
    ASSERT_TRUE(setCookie.has_value());
    EXPECT_EQ(setCookie->rfind("sid=", 0), 0u);
    EXPECT_NE(setCookie->find("HttpOnly"), std::string::npos);
    EXPECT_NE(setCookie->find("Secure"), std::string::npos);
    EXPECT_NE(setCookie->find("SameSite=Lax"), std::string::npos);
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(SessionEndpointsTest, Visits_CountAcrossRequests) {
    send(*visits_, "GET", "/api/v1/session/visits");
    send(*visits_, "GET", "/api/v1/session/visits");
    auto res = send(*visits_, "GET", "/api/v1/session/visits");

    EXPECT_EQ(parseJson(res.getBody())["visits"], 3);
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(SessionEndpointsTest, ModifiedSession_SameIdReissued) {
    send(*visits_, "GET", "/api/v1/session/visits");
    auto first = cookie_;

    auto res = send(*visits_, "GET", "/api/v1/session/visits");

    // Запись перезаписана с новым TTL: cookie продлевается, id прежний
    ASSERT_TRUE(res.getHeader("Set-Cookie").has_value());
    EXPECT_EQ(cookie_, first);
}

TEST_F(SessionEndpointsTest, UnknownCookie_StartsFreshSession) {
    cookie_ = "sid=" + std::string(43, 'x');

    auto res = send(*visits_, "GET", "/api/v1/session/visits");

    EXPECT_EQ(parseJson(res.getBody())["visits"], 1);
    ASSERT_TRUE(res.getHeader("Set-Cookie").has_value());
    EXPECT_EQ(res.getHeader("Set-Cookie")->find(std::string(43, 'x')), std::string::npos);
}

// ============================================================================
// LOGIN / LOGOUT
// ============================================================================

TEST_F(SessionEndpointsTest, Login_RegeneratesIdAndKeepsData) {
    send(*visits_, "GET", "/api/v1/session/visits");
    auto before = cookie_;

    auto res = send(*login_, "POST", "/api/v1/session/login", R"({"user":"alice"})");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["user"], "alice");
    EXPECT_NE(cookie_, before);
    EXPECT_EQ(store_->size(), 1u);

    auto visits = send(*visits_, "GET", "/api/v1/session/visits");
    auto json = parseJson(visits.getBody());
    EXPECT_EQ(json["visits"], 2);
    EXPECT_EQ(json["user"], "alice");
}

TEST_F(SessionEndpointsTest, OldIdAfterLogin_IsRejected) {
    send(*visits_, "GET", "/api/v1/session/visits");
    auto stolen = cookie_;
    send(*login_, "POST", "/api/v1/session/login", R"({"user":"alice"})");

    cookie_ = stolen;
    auto res = send(*visits_, "GET", "/api/v1/session/visits");

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["visits"], 1);
    EXPECT_FALSE(json.contains("user"));
}

TEST_F(SessionEndpointsTest, Login_InvalidJson_400_NoSessionCreated) {
    auto res = send(*login_, "POST", "/api/v1/session/login", "not json");

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Invalid JSON");
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(SessionEndpointsTest, Login_MissingUser_400) {
    auto res = send(*login_, "POST", "/api/v1/session/login", R"({"name":"alice"})");

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Field 'user' is required");
}

TEST_F(SessionEndpointsTest, Logout_RemovesSessionAndClearsCookie) {
    send(*login_, "POST", "/api/v1/session/login", R"({"user":"alice"})");
    ASSERT_EQ(store_->size(), 1u);

    auto res = send(*logout_, "POST", "/api/v1/session/logout");

    EXPECT_EQ(res.getStatus(), 200);
    auto setCookie = res.getHeader("Set-Cookie");
    ASSERT_TRUE(setCookie.has_value());
    EXPECT_EQ(setCookie->rfind("sid=;", 0), 0u);
    EXPECT_NE(setCookie->find("Max-Age=0"), std::string::npos);
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_TRUE(cookie_.empty());
}

TEST_F(SessionEndpointsTest, Logout_WithoutSession_StillClearsCookie) {
    auto res = send(*logout_, "POST", "/api/v1/session/logout");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(res.getHeader("Set-Cookie").has_value());
    EXPECT_EQ(store_->size(), 0u);
}

// ============================================================================
// ERRORS
// ============================================================================

TEST_F(SessionEndpointsTest, StoreUnavailable_503_NoCookie) {
    auto failing = std::make_shared<tests::MockSessionStore>();
    EXPECT_CALL(*failing, ttl()).WillRepeatedly(::testing::Return(std::chrono::milliseconds(1h)));
    EXPECT_CALL(*failing, load(_))
        .WillRepeatedly(Throw(domain::StoreUnavailableError("connection refused")));
    auto sessions = std::make_shared<application::SessionMiddleware>(failing, random_, config_);
    SessionHttpMiddleware handler(sessions, std::make_shared<VisitCounterHandler>());

    cookie_ = "sid=" + std::string(43, 'a');
    auto res = send(handler, "GET", "/api/v1/session/visits");

    EXPECT_EQ(res.getStatus(), 503);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Session store unavailable");
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

TEST_F(SessionEndpointsTest, EntropyFailure_500_NoCookie) {
    random_->setFailing(true);

    auto res = send(*visits_, "GET", "/api/v1/session/visits");

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Internal server error");
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(SessionEndpointsTest, UnserializableSession_500_NoCookie) {
    SessionHttpMiddleware handler(sessions_, std::make_shared<InvalidUtf8Handler>());

    auto res = send(handler, "POST", "/api/v1/session/profile");

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Internal server error");
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(SessionEndpointsTest, Constructor_RejectsNull) {
    EXPECT_THROW(SessionHttpMiddleware(nullptr, std::make_shared<VisitCounterHandler>()),
                 std::invalid_argument);
    EXPECT_THROW(SessionHttpMiddleware(sessions_, nullptr), std::invalid_argument);
}

// ============================================================================
// HEALTH
// ============================================================================

TEST(HealthHandlerTest, ReportsStoreBackend) {
    HealthHandler handler("redis");
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/api/v1/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "ok");
    EXPECT_EQ(json["services"]["session_store"], "redis");
}
