#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace websession::adapters::primary {

/**
 * @brief Привязать пользователя к сессии
 *
 * Endpoint: POST /api/v1/session/login
 *
 * Request:
 *   {
 *     "user": "alice"
 *   }
 *
 * Response (200 OK):
 *   {
 *     "user": "alice",
 *     "message": "Logged in"
 *   }
 *
 * Errors:
 *   400 Bad Request: нет поля user или невалидный JSON
 *
 * @note Сессия получает новый id (защита от session fixation),
 *       накопленные данные сохраняются.
 */
class SessionLoginHandler : public ISessionHandler {
public:
    SessionLoginHandler() {
        std::cout << "[SessionLoginHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, application::SessionHandle& session) override {
        auto body = nlohmann::json::parse(req.getBody(), nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            sendError(res, 400, "Invalid JSON");
            return;
        }

        std::string user = body.value("user", "");
        if (user.empty()) {
            sendError(res, 400, "Field 'user' is required");
            return;
        }

        session.set("user", user);
        session.regenerate();

        nlohmann::json response;
        response["user"] = user;
        response["message"] = "Logged in";
        res.setResult(200, "application/json", response.dump());
    }

private:
    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace websession::adapters::primary
