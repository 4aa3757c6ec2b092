#pragma once

#include "ports/input/IAuthService.hpp"
#include "ports/output/IIdentityRepository.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/ITokenProvider.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Сервис аутентификации
 *
 * register: repository -> hasher -> repository.insert
 * login:    repository -> hasher.verify -> tokenProvider.issue
 * authenticate: tokenProvider.verify -> repository (по subject)
 *
 * Ошибки намеренно не различают причину: неизвестный email и неверный пароль
 * дают один INVALID_CREDENTIALS, любой непринятый токен даёт INVALID_TOKEN.
 */
class AuthService : public ports::input::IAuthService {
public:
    static constexpr const char* TOKEN_TYPE = "bearer";
    static constexpr const char* MSG_DUPLICATE = "Email already registered";
    static constexpr const char* MSG_INVALID_CREDENTIALS = "Incorrect email or password";
    static constexpr const char* MSG_INVALID_TOKEN = "Invalid or expired token";

    AuthService(
        std::shared_ptr<ports::output::IIdentityRepository> identityRepo,
        std::shared_ptr<ports::output::IPasswordHasher> passwordHasher,
        std::shared_ptr<ports::output::ITokenProvider> tokenProvider
    ) : identityRepo_(std::move(identityRepo))
      , passwordHasher_(std::move(passwordHasher))
      , tokenProvider_(std::move(tokenProvider))
    {
        std::cout << "[AuthService] Created" << std::endl;
    }

    ports::input::RegisterResult registerUser(
        const std::string& email,
        const std::string& password
    ) override {
        // Быстрый отказ без расчёта хэша
        if (identityRepo_->findByEmail(email)) {
            return duplicate();
        }

        std::string passwordHash = passwordHasher_->hash(password);

        // Между find и insert мог успеть другой запрос: insert атомарен
        auto identity = identityRepo_->insert(email, passwordHash);
        if (!identity) {
            return duplicate();
        }

        std::cout << "[AuthService] Registered id=" << identity->id << " email=" << email << std::endl;

        ports::input::RegisterResult result;
        result.success = true;
        result.identity = publicView(*identity);
        result.message = "User registered successfully";
        return result;
    }

    ports::input::LoginResult login(
        const std::string& email,
        const std::string& password
    ) override {
        auto identity = identityRepo_->findByEmail(email);
        if (!identity || !passwordHasher_->verify(password, identity->passwordHash)) {
            ports::input::LoginResult result;
            result.error = domain::AuthError::INVALID_CREDENTIALS;
            result.message = MSG_INVALID_CREDENTIALS;
            return result;
        }

        ports::input::LoginResult result;
        result.success = true;
        result.accessToken = tokenProvider_->issue(identity->email);
        result.tokenType = TOKEN_TYPE;
        result.message = "Login successful";
        return result;
    }

    ports::input::AuthenticateResult authenticate(const std::string& token) override {
        auto verification = tokenProvider_->verify(token);
        if (!verification.valid()) {
            std::cout << "[AuthService] Token rejected: " << domain::toString(verification.status) << std::endl;
            return invalidToken();
        }

        auto identity = identityRepo_->findByEmail(verification.claims.subject);
        if (!identity) {
            std::cout << "[AuthService] Token rejected: unknown subject" << std::endl;
            return invalidToken();
        }

        ports::input::AuthenticateResult result;
        result.success = true;
        result.identity = publicView(*identity);
        result.message = "Valid";
        return result;
    }

private:
    std::shared_ptr<ports::output::IIdentityRepository> identityRepo_;
    std::shared_ptr<ports::output::IPasswordHasher> passwordHasher_;
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider_;

    // Хэш пароля не покидает сервис
    static domain::Identity publicView(const domain::Identity& identity) {
        return domain::Identity(identity.id, identity.email);
    }

    static ports::input::RegisterResult duplicate() {
        ports::input::RegisterResult result;
        result.error = domain::AuthError::DUPLICATE_ACCOUNT;
        result.message = MSG_DUPLICATE;
        return result;
    }

    static ports::input::AuthenticateResult invalidToken() {
        ports::input::AuthenticateResult result;
        result.error = domain::AuthError::INVALID_TOKEN;
        result.message = MSG_INVALID_TOKEN;
        return result;
    }
};

} // namespace ledger::application
