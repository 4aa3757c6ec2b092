#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Результат проверки токена
 * 
 * Issued -> VALID (пока now < exp) -> EXPIRED (now >= exp).
 * INVALID: отдельный терминальный класс для подделанных и битых токенов.
 */
enum class TokenStatus {
    VALID,
    EXPIRED,
    INVALID
};

inline std::string toString(TokenStatus status) {
    switch (status) {
        case TokenStatus::VALID:   return "valid";
        case TokenStatus::EXPIRED: return "expired";
        case TokenStatus::INVALID: return "invalid";
    }
    return "unknown";
}

} // namespace ledger::domain
