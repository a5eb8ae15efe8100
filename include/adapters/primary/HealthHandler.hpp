#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <string>

namespace websession::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья сервера
 *
 * Endpoint: GET /api/v1/health
 *
 * Сессию не трогает: ни Cookie, ни Set-Cookie.
 */
class HealthHandler : public IHttpHandler
{
public:
    explicit HealthHandler(std::string storeBackend)
        : storeBackend_(std::move(storeBackend))
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        nlohmann::json response;
        response["status"] = "ok";
        response["timestamp"] = getCurrentTimestamp();

        nlohmann::json services;
        services["http_server"] = "ready";
        services["session_store"] = storeBackend_;
        response["services"] = services;

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump(2)); // Pretty print
    }

private:
    std::string storeBackend_;

    std::string getCurrentTimestamp() const
    {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm = *std::gmtime(&t);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }
};

} // namespace websession::adapters::primary
