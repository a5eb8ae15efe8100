#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace websession::adapters::primary {

/**
 * @brief Счётчик посещений в сессии
 *
 * Endpoint: GET /api/v1/session/visits
 *
 * Response (200 OK):
 *   {
 *     "visits": 3,
 *     "user": "alice"      // только после login
 *   }
 */
class VisitCounterHandler : public ISessionHandler {
public:
    VisitCounterHandler() {
        std::cout << "[VisitCounterHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, application::SessionHandle& session) override {
        nlohmann::json response;
        response["visits"] = session.increment("visits");

        if (auto user = session.get<std::string>("user")) {
            response["user"] = *user;
        }

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace websession::adapters::primary
