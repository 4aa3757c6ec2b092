#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief Middleware проверки bearer токена для защищённых маршрутов.
     *
     * При успехе кладёт в attributes "userId" и "email" и оставляет статус 0,
     * чтобы ProtectedRouteHandler передал запрос дальше. Иначе отвечает 401.
     */
    class BearerAuthMiddleware : public IHttpHandler
    {
    public:
        explicit BearerAuthMiddleware(
            std::shared_ptr<ports::input::IAuthService> authService) : authService_(std::move(authService))
        {
            std::cout << "[BearerAuthMiddleware] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string token = req.getBearerToken().value_or("");
            if (token.empty())
            {
                sendUnauthorized(res, "Bearer token required");
                return;
            }

            ports::input::AuthenticateResult result;
            try
            {
                result = authService_->authenticate(token);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[BearerAuthMiddleware] Error: " << e.what() << std::endl;
                nlohmann::json error;
                error["error"] = "Internal server error";
                res.setResult(500, "application/json", error.dump());
                return;
            }

            if (!result.success)
            {
                sendUnauthorized(res, result.message);
                return;
            }

            req.setAttribute("userId", std::to_string(result.identity.id));
            req.setAttribute("email", result.identity.email);
            res.setStatus(0); // для middleware
        }

    private:
        std::shared_ptr<ports::input::IAuthService> authService_;

        void sendUnauthorized(IResponse &res, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = domain::toString(domain::AuthError::INVALID_TOKEN);
            error["message"] = message;
            res.setHeader("WWW-Authenticate", "Bearer");
            res.setResult(401, "application/json", error.dump());
        }
    };

} // namespace ledger::adapters::primary
