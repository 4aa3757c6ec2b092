#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Зарегистрированная учётная запись
 * 
 * Создаётся при регистрации и больше не меняется.
 * Принадлежит только репозиторию (Account Directory).
 */
struct Identity {
    int64_t id = 0;             ///< Монотонно выдаваемый ID (начиная с 1)
    std::string email;          ///< Уникальный ключ, с учётом регистра
    std::string passwordHash;   ///< Хэш пароля (pbkdf2_sha256$...), наружу не отдаётся

    Identity() = default;

    Identity(int64_t id,
             const std::string& email,
             const std::string& passwordHash = "")
        : id(id)
        , email(email)
        , passwordHash(passwordHash)
    {}
};

} // namespace ledger::domain
