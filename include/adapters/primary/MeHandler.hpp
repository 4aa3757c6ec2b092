#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/auth/me: текущий пользователь
     *
     * Стоит в цепочке после BearerAuthMiddleware и читает его attributes.
     */
    class MeHandler : public IHttpHandler
    {
    public:
        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            auto userId = req.getAttribute("userId");
            auto email = req.getAttribute("email");
            if (!userId || !email)
            {
                std::cerr << "[MeHandler] Error: called without BearerAuthMiddleware" << std::endl;
                sendError(res, 500, "Internal server error");
                return;
            }

            nlohmann::json response;
            response["id"] = std::stoll(*userId);
            response["email"] = *email;

            res.setResult(200, "application/json", response.dump());
        }

    private:
        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace ledger::adapters::primary
