#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace websession::adapters::primary {

/**
 * @brief Уничтожить сессию
 *
 * Endpoint: POST /api/v1/session/logout
 *
 * Response (200 OK):
 *   {
 *     "message": "Logged out"
 *   }
 *
 * @note Идемпотентно: без сессии тоже 200, cookie у клиента стирается.
 */
class SessionLogoutHandler : public ISessionHandler {
public:
    SessionLogoutHandler() {
        std::cout << "[SessionLogoutHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, application::SessionHandle& session) override {
        session.destroy();

        nlohmann::json response;
        response["message"] = "Logged out";
        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace websession::adapters::primary
