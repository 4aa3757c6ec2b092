#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>

namespace ledger::adapters::primary {

/**
 * @brief Health check handler
 * 
 * GET /health
 */
class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["api_status"] = "online";
        response["service"] = "ledger-auth-service";
        response["version"] = "0.1.0";

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump());
    }
};

} // namespace ledger::adapters::primary
