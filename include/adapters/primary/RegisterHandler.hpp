#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary {

/**
 * @brief Регистрация нового пользователя
 * 
 * POST /api/v1/auth/register
 * {
 *   "email": "scientist@example.com",
 *   "password": "SecurePassword123"
 * }
 * 
 * Response 201:
 * {
 *   "id": 1,
 *   "email": "scientist@example.com"
 * }
 */
class RegisterHandler : public IHttpHandler {
public:
    explicit RegisterHandler(
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

            auto result = authService_->registerUser(email, password);

            if (!result.success) {
                nlohmann::json error;
                error["error"] = domain::toString(result.error.value_or(domain::AuthError::DUPLICATE_ACCOUNT));
                error["message"] = result.message;
                res.setResult(409, "application/json", error.dump());
                return;
            }

            // Хэш пароля наружу не отдаём
            nlohmann::json response;
            response["id"] = result.identity.id;
            response["email"] = result.identity.email;

            res.setStatus(201);
            res.setHeader("Content-Type", "application/json");
            res.setBody(response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[RegisterHandler] Error: " << e.what() << std::endl;
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
