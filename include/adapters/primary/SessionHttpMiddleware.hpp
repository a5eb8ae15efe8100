#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/ISessionHandler.hpp"
#include "application/SessionMiddleware.hpp"
#include "domain/errors/SessionErrors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace websession::adapters::primary
{

    /**
     * @brief Декоратор, подключающий сессию к обычному IHttpHandler маршруту
     *
     * Cookie -> SessionMiddleware::resolve() -> inner handler -> commit() -> Set-Cookie.
     *
     * Ошибки:
     * - хранилище недоступно -> 503 {"error": "Session store unavailable"}
     * - не удалось сгенерировать id -> 500 {"error": "Internal server error"}
     * - любое другое исключение (handler, сериализация сессии) -> 500
     * Во всех случаях Set-Cookie не выставляется.
     */
    class SessionHttpMiddleware : public IHttpHandler
    {
    public:
        SessionHttpMiddleware(
            std::shared_ptr<application::SessionMiddleware> sessions,
            std::shared_ptr<ISessionHandler> inner) : sessions_(std::move(sessions)), inner_(std::move(inner))
        {
            if (!sessions_ || !inner_)
            {
                throw std::invalid_argument("SessionHttpMiddleware requires sessions and inner handler");
            }
        }

        void handle(IRequest &req, IResponse &res) override
        {
            try
            {
                auto outcome = sessions_->handle(req.getHeader("Cookie"),
                    [this, &req, &res](application::SessionHandle &session)
                    {
                        inner_->handle(req, res, session);
                    });

                if (outcome.setCookie)
                {
                    res.setHeader("Set-Cookie", *outcome.setCookie);
                }
            }
            catch (const domain::StoreUnavailableError &e)
            {
                std::cerr << "[SessionHttpMiddleware] " << req.getMethod() << " " << req.getPath()
                          << ": session store unavailable: " << e.what() << std::endl;
                sendError(res, 503, "Session store unavailable");
            }
            catch (const domain::IdentifierGenerationError &e)
            {
                std::cerr << "[SessionHttpMiddleware] FATAL: cannot generate session id: "
                          << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SessionHttpMiddleware] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<application::SessionMiddleware> sessions_;
        std::shared_ptr<ISessionHandler> inner_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace websession::adapters::primary
