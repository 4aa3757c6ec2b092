#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary {

/**
 * @brief Логин пользователя
 * 
 * POST /api/v1/auth/login
 * {
 *   "email": "scientist@example.com",
 *   "password": "SecurePassword123"
 * }
 * 
 * Response:
 * {
 *   "access_token": "eyJ...",
 *   "token_type": "bearer"
 * }
 */
class LoginHandler : public IHttpHandler {
public:
    explicit LoginHandler(
        std::shared_ptr<ports::input::IAuthService> authService
    ) : authService_(std::move(authService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());
            
            std::string email = body.value("email", "");
            std::string password = body.value("password", "");

            if (email.empty() || password.empty()) {
                sendError(res, 400, "email and password are required");
                return;
            }

            auto result = authService_->login(email, password);

            if (!result.success) {
                nlohmann::json error;
                error["error"] = domain::toString(result.error.value_or(domain::AuthError::INVALID_CREDENTIALS));
                error["message"] = result.message;
                res.setStatus(401);
                res.setHeader("Content-Type", "application/json");
                res.setHeader("WWW-Authenticate", "Bearer");
                res.setBody(error.dump());
                return;
            }

            nlohmann::json response;
            response["access_token"] = result.accessToken;
            response["token_type"] = result.tokenType;

            res.setStatus(200);
            res.setHeader("Content-Type", "application/json");
            res.setBody(response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[LoginHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setStatus(status);
        res.setHeader("Content-Type", "application/json");
        res.setBody(error.dump());
    }
};

} // namespace ledger::adapters::primary
