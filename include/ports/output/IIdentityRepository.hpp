#pragma once

#include "domain/Identity.hpp"
#include <string>
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория учётных записей (Account Directory)
 * 
 * Output Port для хранилища пользователей. Любая реализация обязана
 * делать insert атомарным относительно проверки существования email.
 */
class IIdentityRepository {
public:
    virtual ~IIdentityRepository() = default;

    /**
     * @brief Атомарно создать запись, если email свободен
     * @param email Уникальный ключ
     * @param passwordHash Хэш пароля
     * @return Созданная Identity или nullopt, если email уже занят
     */
    virtual std::optional<domain::Identity> insert(
        const std::string& email,
        const std::string& passwordHash
    ) = 0;

    /**
     * @brief Найти пользователя по email
     * @return Identity или nullopt
     */
    virtual std::optional<domain::Identity> findByEmail(const std::string& email) = 0;

    /**
     * @brief Количество сохранённых записей
     */
    virtual size_t size() = 0;
};

} // namespace ledger::ports::output
