#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Ошибки аутентификации, видимые клиенту
 * 
 * INVALID_CREDENTIALS объединяет "нет такого email" и "неверный пароль",
 * INVALID_TOKEN объединяет битый, подделанный, истёкший токен
 * и токен удалённого пользователя.
 */
enum class AuthError {
    DUPLICATE_ACCOUNT,      ///< Email уже зарегистрирован
    INVALID_CREDENTIALS,    ///< Неверный email или пароль
    INVALID_TOKEN           ///< Токен не принят
};

/**
 * @brief Преобразовать AuthError в строку
 */
inline std::string toString(AuthError error) {
    switch (error) {
        case AuthError::DUPLICATE_ACCOUNT:   return "DUPLICATE_ACCOUNT";
        case AuthError::INVALID_CREDENTIALS: return "INVALID_CREDENTIALS";
        case AuthError::INVALID_TOKEN:       return "INVALID_TOKEN";
    }
    return "UNKNOWN";
}

} // namespace ledger::domain
