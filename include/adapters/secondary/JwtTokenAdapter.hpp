#pragma once

#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IClock.hpp"
#include "settings/AuthSettings.hpp"
#include <jwt-cpp/jwt.h>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace ledger::adapters::secondary
{

    /**
     * @brief JWT провайдер (HS256, jwt-cpp)
     *
     * header  = {"alg":"HS256","typ":"JWT"}
     * payload = {"sub": email, "iat": unix, "exp": unix}
     *
     * Токены stateless: ничего не хранится, отзыва нет.
     * Время берётся из IClock, поэтому срок жизни проверяется и в тестах.
     */
    class JwtTokenAdapter : public ports::output::ITokenProvider
    {
    public:
        JwtTokenAdapter(std::shared_ptr<settings::AuthSettings> settings,
                        std::shared_ptr<ports::output::IClock> clock)
            : settings_(std::move(settings)), clock_(std::move(clock))
        {
        }

        /**
         * @throws std::invalid_argument пустой subject или ttl вне [0, AuthSettings::getMaxTokenLifetime()]
         */
        std::string issue(const std::string &subject,
                          std::optional<std::chrono::seconds> ttl = std::nullopt) override
        {
            if (subject.empty())
                throw std::invalid_argument("Token subject must not be empty");

            std::chrono::seconds lifetime = ttl.value_or(settings_->getTokenLifetime());
            if (lifetime.count() < 0 || lifetime > settings::AuthSettings::getMaxTokenLifetime())
                throw std::invalid_argument("Token lifetime out of range");

            auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock_->now());

            return jwt::create()
                .set_type("JWT")
                .set_subject(subject)
                .set_issued_at(now)
                .set_expires_at(now + lifetime)
                .sign(jwt::algorithm::hs256{settings_->getJwtSecret()});
        }

        ports::output::TokenVerification verify(const std::string &token) override
        {
            ports::output::TokenVerification result;

            try
            {
                auto decoded = jwt::decode(token);

                // base64url допускает несколько записей одной подписи (младшие биты
                // последнего символа), принимаем только каноническую
                std::string canonical = jwt::base::trim<jwt::alphabet::base64url>(
                    jwt::base::encode<jwt::alphabet::base64url>(decoded.get_signature()));
                if (canonical != decoded.get_signature_base64())
                    return result;

                std::error_code ec;
                jwt::verify<ClockAdapter, jwt::traits::kazuho_picojson>(ClockAdapter{clock_})
                    .allow_algorithm(jwt::algorithm::hs256{settings_->getJwtSecret()})
                    .verify(decoded, ec);

                // token_expired выставляется только после проверки подписи
                bool expired = (ec == jwt::error::token_verification_error::token_expired);
                if (ec && !expired)
                    return result;

                auto claims = readClaims(decoded);
                if (!claims)
                    return result;

                result.claims = *claims;
                result.status = (expired || claims->isExpiredAt(nowSeconds()))
                                    ? domain::TokenStatus::EXPIRED
                                    : domain::TokenStatus::VALID;
                return result;
            }
            catch (const std::exception &)
            {
                // битый base64, не-JSON, claim неверного типа
                return result;
            }
        }

    private:
        std::shared_ptr<settings::AuthSettings> settings_;
        std::shared_ptr<ports::output::IClock> clock_;

        /**
         * @brief Часы для jwt::verify поверх IClock
         */
        struct ClockAdapter
        {
            std::shared_ptr<ports::output::IClock> clock;

            jwt::date now() const { return clock->now(); }
        };

        int64_t nowSeconds() const
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       clock_->now().time_since_epoch())
                .count();
        }

        static std::optional<domain::TokenClaims> readClaims(const jwt::decoded_jwt<jwt::traits::kazuho_picojson> &decoded)
        {
            if (!decoded.has_subject() || !decoded.has_expires_at())
                return std::nullopt;

            auto exp = decoded.get_payload_claim("exp");
            if (exp.get_type() != jwt::json::type::integer)
                return std::nullopt;

            domain::TokenClaims claims;
            claims.subject = decoded.get_subject();
            claims.expiresAt = exp.as_integer();

            if (decoded.has_issued_at())
            {
                auto iat = decoded.get_payload_claim("iat");
                if (iat.get_type() == jwt::json::type::integer)
                    claims.issuedAt = iat.as_integer();
            }

            if (claims.subject.empty())
                return std::nullopt;

            return claims;
        }
    };

} // namespace ledger::adapters::secondary
