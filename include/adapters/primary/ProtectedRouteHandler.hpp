#pragma once

#include <IHttpHandler.hpp>
#include "BearerAuthMiddleware.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief Маршрут, доступный только с валидным bearer токеном
     *
     * Сначала BearerAuthMiddleware: при отказе ответ 401 (с WWW-Authenticate)
     * уже сформирован и target не вызывается. При успехе target читает
     * "userId"/"email" из attributes и обязан выставить статус.
     */
    class ProtectedRouteHandler : public IHttpHandler
    {
    public:
        ProtectedRouteHandler(std::shared_ptr<BearerAuthMiddleware> guard,
                              std::shared_ptr<IHttpHandler> target)
            : guard_(std::move(guard)), target_(std::move(target))
        {
            if (!guard_ || !target_)
                throw std::invalid_argument("ProtectedRouteHandler requires guard and target");
        }

        void handle(IRequest &req, IResponse &res) override
        {
            guard_->handle(req, res);
            if (res.getStatus() != 0)
                return;

            target_->handle(req, res);
            if (res.getStatus() == 0)
            {
                std::cerr << "[ProtectedRouteHandler] Error: target left httpStatus zero" << std::endl;
                nlohmann::json error;
                error["error"] = "Internal server error";
                res.setResult(500, "application/json", error.dump());
            }
        }

    private:
        std::shared_ptr<BearerAuthMiddleware> guard_;
        std::shared_ptr<IHttpHandler> target_;
    };

} // namespace ledger::adapters::primary
