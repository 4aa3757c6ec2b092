#pragma once

#include <string>

namespace ledger::ports::output {

/**
 * @brief Односторонний хэш паролей с солью
 */
class IPasswordHasher {
public:
    virtual ~IPasswordHasher() = default;

    /**
     * @brief Захэшировать пароль со свежей солью
     * 
     * Соль встроена в результат, два вызова с одним паролем дают разные строки.
     */
    virtual std::string hash(const std::string& password) const = 0;

    /**
     * @brief Проверить пароль по сохранённому хэшу
     * @return false для неверного пароля или некорректного хэша (без исключений)
     */
    virtual bool verify(const std::string& password, const std::string& hash) const = 0;
};

} // namespace ledger::ports::output
