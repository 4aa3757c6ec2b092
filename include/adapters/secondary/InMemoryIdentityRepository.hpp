#pragma once

#include "ports/output/IIdentityRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реализация репозитория учётных записей
 * 
 * Проверка email и выдача ID выполняются под одной блокировкой
 * ThreadSafeMap, поэтому из двух одновременных регистраций одного
 * email побеждает ровно одна, а ID выдаются только успешным вставкам.
 */
class InMemoryIdentityRepository : public ports::output::IIdentityRepository {
public:
    InMemoryIdentityRepository() = default;

    std::optional<domain::Identity> insert(
        const std::string& email,
        const std::string& passwordHash
    ) override {
        auto inserted = identities_.insertIfAbsent(email, [this, &email, &passwordHash] {
            return std::make_shared<domain::Identity>(++lastId_, email, passwordHash);
        });
        if (!inserted) {
            return std::nullopt;
        }
        return *inserted;
    }

    std::optional<domain::Identity> findByEmail(const std::string& email) override {
        auto identity = identities_.find(email);
        return identity ? std::optional<domain::Identity>(*identity) : std::nullopt;
    }

    size_t size() override {
        return identities_.size();
    }

private:
    ThreadSafeMap<std::string, domain::Identity> identities_;
    int64_t lastId_ = 0;  // меняется только внутри insertIfAbsent (под блокировкой identities_)
};

} // namespace ledger::adapters::secondary
