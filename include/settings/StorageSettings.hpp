#pragma once

#include "settings/Env.hpp"
#include <string>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Тип хранилища учётных записей
 */
enum class StorageType {
    MEMORY,     ///< In-process таблица
    POSTGRES    ///< PostgreSQL (см. DbSettings)
};

/**
 * @brief Выбор хранилища из ENV
 * 
 * AUTH_STORAGE: "memory" (default) или "postgres"
 */
class StorageSettings {
public:
    StorageSettings() {
        type_ = parseStorageType(env::getOrDefault("AUTH_STORAGE", "memory"));
    }

    explicit StorageSettings(StorageType type) : type_(type) {}

    StorageType getType() const { return type_; }

    /**
     * @throws std::invalid_argument если значение не распознано
     */
    static StorageType parseStorageType(const std::string& str) {
        if (str == "memory" || str == "MEMORY")     return StorageType::MEMORY;
        if (str == "postgres" || str == "POSTGRES") return StorageType::POSTGRES;
        throw std::invalid_argument("Unknown AUTH_STORAGE: " + str);
    }

private:
    StorageType type_;
};

} // namespace ledger::settings
