#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Claims из bearer токена
 */
struct TokenClaims {
    std::string subject;        ///< Email владельца (sub claim)
    int64_t issuedAt = 0;       ///< Unix timestamp выпуска (iat claim)
    int64_t expiresAt = 0;      ///< Unix timestamp истечения (exp claim)

    /**
     * @brief Истёк ли токен на момент nowSeconds
     */
    bool isExpiredAt(int64_t nowSeconds) const {
        return nowSeconds >= expiresAt;
    }
};

} // namespace ledger::domain
