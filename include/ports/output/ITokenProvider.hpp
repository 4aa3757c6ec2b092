#pragma once

#include "domain/TokenClaims.hpp"
#include "domain/enums/TokenStatus.hpp"
#include <string>
#include <optional>
#include <chrono>

namespace ledger::ports::output {

/**
 * @brief Результат проверки токена
 */
struct TokenVerification {
    domain::TokenStatus status = domain::TokenStatus::INVALID;
    domain::TokenClaims claims;     ///< Заполнены для VALID и EXPIRED

    bool valid() const { return status == domain::TokenStatus::VALID; }
};

/**
 * @brief Интерфейс провайдера bearer токенов
 */
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;

    /**
     * @brief Выпустить подписанный токен
     * @param subject Владелец (email)
     * @param ttl Время жизни; при nullopt берётся значение из настроек
     */
    virtual std::string issue(
        const std::string& subject,
        std::optional<std::chrono::seconds> ttl = std::nullopt
    ) = 0;

    /**
     * @brief Проверить подпись и срок действия
     * 
     * Никогда не бросает исключений на любом входе.
     */
    virtual TokenVerification verify(const std::string& token) = 0;
};

} // namespace ledger::ports::output
