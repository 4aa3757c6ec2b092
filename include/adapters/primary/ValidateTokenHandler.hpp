#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary {

/**
 * @brief Валидация токена (внутренний API для других сервисов)
 * 
 * POST /api/v1/auth/validate
 * {
 *   "token": "eyJ..."
 * }
 * 
 * Response:
 * {
 *   "valid": true,
 *   "id": 1,
 *   "email": "scientist@example.com"
 * }
 */
class ValidateTokenHandler : public IHttpHandler {
public:
    explicit ValidateTokenHandler(
        std::shared_ptr<ports::input::IAuthService> authService
    ) : authService_(std::move(authService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());
            
            std::string token = body.value("token", "");

            if (token.empty()) {
                sendError(res, 400, "token is required");
                return;
            }

            auto result = authService_->authenticate(token);

            nlohmann::json response;
            response["valid"] = result.success;
            
            if (result.success) {
                response["id"] = result.identity.id;
                response["email"] = result.identity.email;
            } else {
                response["error"] = domain::toString(result.error.value_or(domain::AuthError::INVALID_TOKEN));
                response["message"] = result.message;
            }

            res.setStatus(200);
            res.setHeader("Content-Type", "application/json");
            res.setBody(response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[ValidateTokenHandler] Error: " << e.what() << std::endl;
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
