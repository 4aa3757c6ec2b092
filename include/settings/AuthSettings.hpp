#pragma once

#include "settings/Env.hpp"
#include <string>
#include <chrono>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Настройки аутентификации из ENV
 *
 * Читает из ENV:
 * - AUTH_JWT_SECRET (обязательно, непустой)
 * - AUTH_TOKEN_LIFETIME_MINUTES (default: 30, не больше года)
 * - AUTH_PASSWORD_ITERATIONS (default: 100000)
 *
 * Алгоритм подписи фиксирован: HS256.
 */
class AuthSettings {
public:
    static constexpr int DEFAULT_TOKEN_LIFETIME_MINUTES = 30;
    static constexpr int MAX_TOKEN_LIFETIME_MINUTES = 60 * 24 * 365;
    static constexpr int DEFAULT_PASSWORD_ITERATIONS = 100000;
    static constexpr int MAX_PASSWORD_ITERATIONS = 10000000;

    /**
     * @throws std::runtime_error если AUTH_JWT_SECRET не задан
     * @throws std::invalid_argument если числовое значение некорректно
     */
    AuthSettings() {
        jwtSecret_ = env::getRequired("AUTH_JWT_SECRET");
        tokenLifetime_ = std::chrono::minutes(env::parseInt(
            "AUTH_TOKEN_LIFETIME_MINUTES",
            env::getOrDefault("AUTH_TOKEN_LIFETIME_MINUTES", std::to_string(DEFAULT_TOKEN_LIFETIME_MINUTES)),
            1, MAX_TOKEN_LIFETIME_MINUTES));
        passwordIterations_ = env::parseInt(
            "AUTH_PASSWORD_ITERATIONS",
            env::getOrDefault("AUTH_PASSWORD_ITERATIONS", std::to_string(DEFAULT_PASSWORD_ITERATIONS)),
            1, MAX_PASSWORD_ITERATIONS);
    }

    AuthSettings(const std::string& jwtSecret,
                 std::chrono::seconds tokenLifetime = std::chrono::minutes(DEFAULT_TOKEN_LIFETIME_MINUTES),
                 int passwordIterations = DEFAULT_PASSWORD_ITERATIONS)
        : jwtSecret_(jwtSecret)
        , tokenLifetime_(tokenLifetime)
        , passwordIterations_(passwordIterations)
    {
        if (jwtSecret_.empty()) {
            throw std::invalid_argument("JWT secret must not be empty");
        }
        if (tokenLifetime_.count() <= 0 || tokenLifetime_ > getMaxTokenLifetime()) {
            throw std::invalid_argument("Token lifetime out of range");
        }
        if (passwordIterations_ <= 0 || passwordIterations_ > MAX_PASSWORD_ITERATIONS) {
            throw std::invalid_argument("Password iterations out of range");
        }
    }

    const std::string& getJwtSecret() const { return jwtSecret_; }
    std::string getJwtAlgorithm() const { return "HS256"; }
    std::chrono::seconds getTokenLifetime() const { return tokenLifetime_; }
    int getPasswordIterations() const { return passwordIterations_; }

    static std::chrono::seconds getMaxTokenLifetime() {
        return std::chrono::minutes(MAX_TOKEN_LIFETIME_MINUTES);
    }

private:
    std::string jwtSecret_;
    std::chrono::seconds tokenLifetime_;
    int passwordIterations_;
};

} // namespace ledger::settings
