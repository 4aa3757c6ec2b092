#pragma once

#include "settings/Env.hpp"
#include <string>
#include <utility>

namespace ledger::settings {

/**
 * @brief Подключение к PostgreSQL для хранилища учётных записей
 *
 * Создаётся только при AUTH_STORAGE=postgres. Переменные:
 * AUTH_DB_HOST, AUTH_DB_PORT (1..65535), AUTH_DB_NAME, AUTH_DB_USER,
 * AUTH_DB_PASSWORD (обязательно).
 */
class DbSettings {
public:
    /**
     * @throws std::runtime_error если AUTH_DB_PASSWORD не задан
     * @throws std::invalid_argument если AUTH_DB_PORT некорректен
     */
    DbSettings()
        : DbSettings(
              env::getOrDefault("AUTH_DB_HOST", "localhost"),
              env::parseInt("AUTH_DB_PORT", env::getOrDefault("AUTH_DB_PORT", "5432"), 1, 65535),
              env::getOrDefault("AUTH_DB_NAME", "auth_db"),
              env::getOrDefault("AUTH_DB_USER", "auth_user"),
              env::getRequired("AUTH_DB_PASSWORD"))
    {}

    DbSettings(std::string host, int port, std::string name, std::string user, std::string password)
        : host_(std::move(host))
        , port_(port)
        , name_(std::move(name))
        , user_(std::move(user))
        , password_(std::move(password))
    {
        if (port_ < 1 || port_ > 65535) {
            throw std::invalid_argument("Database port out of range: " + std::to_string(port_));
        }
    }

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getName() const { return name_; }

    /**
     * @brief libpq keyword/value строка, значения в кавычках
     */
    std::string getConnectionString() const {
        return "host=" + quote(host_) +
               " port=" + std::to_string(port_) +
               " dbname=" + quote(name_) +
               " user=" + quote(user_) +
               " password=" + quote(password_);
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;

    // Пробелы, кавычки и '\' в пароле иначе ломают разбор строки
    static std::string quote(const std::string& value) {
        std::string result = "'";
        for (char c : value) {
            if (c == '\'' || c == '\\') {
                result.push_back('\\');
            }
            result.push_back(c);
        }
        result.push_back('\'');
        return result;
    }
};

} // namespace ledger::settings
