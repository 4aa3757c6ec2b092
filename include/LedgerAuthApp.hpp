#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Ports
#include "ports/input/IAuthService.hpp"
#include "ports/output/IIdentityRepository.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/AuthService.hpp"

// Settings
#include "settings/AuthSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/DbSettings.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"
#include "adapters/secondary/JwtTokenAdapter.hpp"
#include "adapters/secondary/InMemoryIdentityRepository.hpp"
#include "adapters/secondary/PostgresIdentityRepository.hpp"

// Primary Adapters
#include "adapters/primary/RootHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RegisterHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/ValidateTokenHandler.hpp"
#include "adapters/primary/BearerAuthMiddleware.hpp"
#include "adapters/primary/MeHandler.hpp"
#include "adapters/primary/ProtectedRouteHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace ledger {

/**
 * @brief Ledger Auth Service Application
 * 
 * Точка входа для Auth микросервиса.
 * Настраивает Boost.DI контейнер и регистрирует HTTP handlers.
 */
class LedgerAuthApp : public BoostBeastApplication {
public:
    LedgerAuthApp() {
        std::cout << "[LedgerAuthApp] Initializing..." << std::endl;
    }
    
    ~LedgerAuthApp() override = default;

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);

        // Без AUTH_JWT_SECRET сервис не стартует
        authSettings_ = std::make_shared<settings::AuthSettings>();
        storageSettings_ = std::make_shared<settings::StorageSettings>();

        std::cout << "[LedgerAuthApp] Environment loaded (token lifetime "
                  << authSettings_->getTokenLifetime().count() << "s, "
                  << authSettings_->getJwtAlgorithm() << ")" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[LedgerAuthApp] Configuring Boost.DI injection..." << std::endl;

        auto identityRepo = createIdentityRepository();

        // ====================================================================
        // Boost.DI Injector Configuration
        // ====================================================================

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings & Infrastructure
            // ================================================================
            di::bind<settings::AuthSettings>()
                .to(authSettings_),

            di::bind<ports::output::IClock>()
                .to<adapters::secondary::SystemClock>()
                .in(di::singleton),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================

            di::bind<ports::output::IIdentityRepository>()
                .to(identityRepo),

            di::bind<ports::output::IPasswordHasher>()
                .to<adapters::secondary::Pbkdf2PasswordHasher>()
                .in(di::singleton),

            di::bind<ports::output::ITokenProvider>()
                .to<adapters::secondary::JwtTokenAdapter>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================

            di::bind<ports::input::IAuthService>()
                .to<application::AuthService>()
                .in(di::singleton)
        );

        std::cout << "[LedgerAuthApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Settings & Infrastructure (2 bindings: AuthSettings, IClock)" << std::endl;
        std::cout << "  ✓ Secondary Adapters (3 bindings: IIdentityRepository, IPasswordHasher, ITokenProvider)" << std::endl;
        std::cout << "  ✓ Application Services (1 binding)" << std::endl;

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[LedgerAuthApp] Registering HTTP Handlers via DI..." << std::endl;

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RootHandler>>();
            registerEndpoint("GET", "/", handler);
            std::cout << "  ✓ RootHandler: GET /" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            registerEndpoint("GET", "/health", handler);
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RegisterHandler>>();
            registerEndpoint("POST", "/api/v1/auth/register", handler);
            std::cout << "  ✓ RegisterHandler: POST /api/v1/auth/register" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::LoginHandler>>();
            registerEndpoint("POST", "/api/v1/auth/login", handler);
            std::cout << "  ✓ LoginHandler: POST /api/v1/auth/login" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ValidateTokenHandler>>();
            registerEndpoint("POST", "/api/v1/auth/validate", handler);
            std::cout << "  ✓ ValidateTokenHandler: POST /api/v1/auth/validate" << std::endl;
        }

        // Защищённый маршрут: bearer middleware -> handler
        {
            auto middleware = injector.create<std::shared_ptr<adapters::primary::BearerAuthMiddleware>>();
            auto me = injector.create<std::shared_ptr<adapters::primary::MeHandler>>();
            auto route = std::make_shared<adapters::primary::ProtectedRouteHandler>(middleware, me);
            registerEndpoint("GET", "/api/v1/auth/me", route);
            std::cout << "  ✓ BearerAuthMiddleware -> MeHandler: GET /api/v1/auth/me" << std::endl;
        }

        std::cout << "[LedgerAuthApp] Configuration complete! 6 handlers registered." << std::endl;
    }

private:
    std::shared_ptr<settings::AuthSettings> authSettings_;
    std::shared_ptr<settings::StorageSettings> storageSettings_;

    std::shared_ptr<ports::output::IIdentityRepository> createIdentityRepository() {
        if (storageSettings_->getType() == settings::StorageType::POSTGRES) {
            std::cout << "[LedgerAuthApp] Storage: postgres" << std::endl;
            return std::make_shared<adapters::secondary::PostgresIdentityRepository>(
                std::make_shared<settings::DbSettings>());
        }
        std::cout << "[LedgerAuthApp] Storage: memory" << std::endl;
        return std::make_shared<adapters::secondary::InMemoryIdentityRepository>();
    }
};

} // namespace ledger
