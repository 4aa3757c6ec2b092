#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>

namespace ledger::adapters::primary {

/**
 * @brief GET /: проверка, что API запущен
 */
class RootHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["message"] = "Welcome to Molecule Ledger API!";

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace ledger::adapters::primary
