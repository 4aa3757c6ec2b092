#pragma once

#include "ports/output/IIdentityRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий учётных записей
 * 
 * insert() берёт LOCK TABLE ... IN EXCLUSIVE MODE внутри транзакции:
 * проверка email и выдача id = MAX(id) + 1 сериализуются между всеми
 * экземплярами сервиса, дубликаты id не расходуют.
 *
 * Ошибки БД логируются и пробрасываются: недоступная база не должна
 * выглядеть как "пользователь не найден".
 */
class PostgresIdentityRepository : public ports::output::IIdentityRepository {
public:
    explicit PostgresIdentityRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresIdentityRepository] Connecting to " << settings_->getHost() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresIdentityRepository] Connected successfully" << std::endl;
            ensureSchema();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresIdentityRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::Identity> insert(
        const std::string& email,
        const std::string& passwordHash
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec("LOCK TABLE identities IN EXCLUSIVE MODE");

            auto existing = txn.exec_params(
                "SELECT 1 FROM identities WHERE email = $1 LIMIT 1",
                email
            );
            if (!existing.empty()) {
                txn.commit();
                return std::nullopt;
            }

            auto result = txn.exec_params(
                R"(
                    INSERT INTO identities (id, email, password_hash, created_at)
                    SELECT COALESCE(MAX(id), 0) + 1, $1::text, $2::text, NOW()
                    FROM identities
                    RETURNING id
                )",
                email,
                passwordHash
            );

            txn.commit();
            return domain::Identity(result[0]["id"].as<int64_t>(), email, passwordHash);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] insert() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Identity> findByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT id, email, password_hash FROM identities WHERE email = $1",
                email
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToIdentity(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] findByEmail() failed: " << e.what() << std::endl;
            throw;
        }
    }

    size_t size() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec("SELECT COUNT(*) AS total FROM identities");
            txn.commit();
            return result[0]["total"].as<size_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] size() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    void ensureSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS identities (
                id            BIGINT PRIMARY KEY,
                email         TEXT NOT NULL UNIQUE,
                password_hash TEXT NOT NULL,
                created_at    TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        txn.commit();
    }

    domain::Identity rowToIdentity(const pqxx::row& row) const {
        return domain::Identity(
            row["id"].as<int64_t>(),
            row["email"].as<std::string>(),
            row["password_hash"].as<std::string>()
        );
    }
};

} // namespace ledger::adapters::secondary
