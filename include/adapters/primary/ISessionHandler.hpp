#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "application/SessionHandle.hpp"

namespace websession::adapters::primary {

/**
 * @brief HTTP handler, которому нужна сессия текущего запроса
 *
 * Вызывается из SessionHttpMiddleware между resolve() и commit().
 */
class ISessionHandler {
public:
    virtual ~ISessionHandler() = default;

    virtual void handle(IRequest& req, IResponse& res, application::SessionHandle& session) = 0;
};

} // namespace websession::adapters::primary
