#pragma once

#include "domain/Identity.hpp"
#include "domain/enums/AuthError.hpp"
#include <string>
#include <optional>

namespace ledger::ports::input {

/**
 * @brief Результат регистрации
 */
struct RegisterResult {
    bool success = false;
    domain::Identity identity;              ///< id и email при success, passwordHash пуст
    std::optional<domain::AuthError> error;
    std::string message;
};

/**
 * @brief Результат логина
 */
struct LoginResult {
    bool success = false;
    std::string accessToken;
    std::string tokenType;                  ///< Всегда "bearer"
    std::optional<domain::AuthError> error;
    std::string message;
};

/**
 * @brief Результат проверки bearer токена
 */
struct AuthenticateResult {
    bool success = false;
    domain::Identity identity;              ///< id и email при success, passwordHash пуст
    std::optional<domain::AuthError> error;
    std::string message;
};

/**
 * @brief Интерфейс сервиса аутентификации
 */
class IAuthService {
public:
    virtual ~IAuthService() = default;

    /**
     * @brief Регистрация нового пользователя
     * 
     * Ошибка: DUPLICATE_ACCOUNT
     */
    virtual RegisterResult registerUser(
        const std::string& email,
        const std::string& password
    ) = 0;

    /**
     * @brief Логин, выдаёт bearer токен
     * 
     * Ошибка: INVALID_CREDENTIALS (одинаковая для неизвестного email и неверного пароля)
     */
    virtual LoginResult login(
        const std::string& email,
        const std::string& password
    ) = 0;

    /**
     * @brief Проверить bearer токен и найти его владельца
     * 
     * Ошибка: INVALID_TOKEN
     */
    virtual AuthenticateResult authenticate(const std::string& token) = 0;
};

} // namespace ledger::ports::input
