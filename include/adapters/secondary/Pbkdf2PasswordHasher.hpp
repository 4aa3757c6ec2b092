#pragma once

#include "ports/output/IPasswordHasher.hpp"
#include "settings/AuthSettings.hpp"
#include <jwt-cpp/base.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief PBKDF2-HMAC-SHA256 хэшер паролей (OpenSSL)
 * 
 * Формат хэша:
 *   pbkdf2_sha256$<iterations>$<base64url salt>$<base64url key>
 * 
 * Соль 16 байт из RAND_bytes, ключ 32 байта. Число итераций берётся из
 * AuthSettings при hash() и из самого хэша при verify(), поэтому смена
 * настроек не ломает уже сохранённые пароли.
 */
class Pbkdf2PasswordHasher : public ports::output::IPasswordHasher {
public:
    static constexpr const char* SCHEME = "pbkdf2_sha256";
    static constexpr size_t SALT_BYTES = 16;
    static constexpr size_t KEY_BYTES = 32;

    explicit Pbkdf2PasswordHasher(std::shared_ptr<settings::AuthSettings> settings)
        : iterations_(settings->getPasswordIterations())
    {}

    std::string hash(const std::string& password) const override {
        std::string salt(SALT_BYTES, '\0');
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&salt[0]), static_cast<int>(salt.size())) != 1) {
            throw std::runtime_error("Failed to generate salt");
        }

        auto key = derive(password, salt, iterations_);
        if (!key) {
            throw std::runtime_error("PBKDF2 derivation failed");
        }

        return std::string(SCHEME) + "$" + std::to_string(iterations_) + "$" +
               encode(salt) + "$" + encode(*key);
    }

    bool verify(const std::string& password, const std::string& hash) const override {
        std::vector<std::string> parts = split(hash, '$');
        if (parts.size() != 4 || parts[0] != SCHEME) {
            return false;
        }

        auto iterations = parseIterations(parts[1]);
        if (!iterations) {
            return false;
        }

        auto salt = decode(parts[2]);
        auto expected = decode(parts[3]);
        if (!salt || salt->empty() || !expected || expected->size() != KEY_BYTES) {
            return false;
        }

        auto derived = derive(password, *salt, *iterations);
        if (!derived) {
            return false;
        }

        return CRYPTO_memcmp(derived->data(), expected->data(), KEY_BYTES) == 0;
    }

private:
    int iterations_;

    static std::optional<std::string> derive(const std::string& password,
                                             const std::string& salt,
                                             int iterations) {
        std::string key(KEY_BYTES, '\0');
        int rc = PKCS5_PBKDF2_HMAC(
            password.data(), static_cast<int>(password.size()),
            reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
            iterations,
            EVP_sha256(),
            static_cast<int>(key.size()),
            reinterpret_cast<unsigned char*>(&key[0]));
        if (rc != 1) {
            return std::nullopt;
        }
        return key;
    }

    static std::optional<int> parseIterations(const std::string& str) {
        if (str.empty() || str.size() > 8) {
            return std::nullopt;
        }
        long value = 0;
        for (char c : str) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        if (value < 1 || value > settings::AuthSettings::MAX_PASSWORD_ITERATIONS) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }

    // base64url без '=' (как сегменты JWT)
    static std::string encode(const std::string& bytes) {
        return jwt::base::trim<jwt::alphabet::base64url>(jwt::base::encode<jwt::alphabet::base64url>(bytes));
    }

    static std::optional<std::string> decode(const std::string& text) {
        if (text.empty() || text.size() % 4 == 1) {
            return std::nullopt;
        }
        try {
            auto bytes = jwt::base::decode<jwt::alphabet::base64url>(jwt::base::pad<jwt::alphabet::base64url>(text));
            // несколько записей одних байт не принимаем
            if (encode(bytes) != text) {
                return std::nullopt;
            }
            return bytes;
        } catch (const std::runtime_error&) {
            return std::nullopt;
        }
    }

    static std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t pos = str.find(delimiter, start);
            if (pos == std::string::npos) {
                parts.push_back(str.substr(start));
                break;
            }
            parts.push_back(str.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }
};

} // namespace ledger::adapters::secondary
