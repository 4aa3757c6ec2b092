#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/RegisterHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/ValidateTokenHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RootHandler.hpp"

#include "application/AuthService.hpp"
#include "adapters/secondary/InMemoryIdentityRepository.hpp"
#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"
#include "adapters/secondary/JwtTokenAdapter.hpp"
#include "settings/AuthSettings.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/MockAuthService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace ledger;
using namespace ledger::tests::mocks;
using namespace ledger::adapters::primary;
using ::testing::_;
using ::testing::Throw;

// ============================================
// TEST FIXTURE
// ============================================

class AuthEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::AuthSettings>(
            "endpoint-test-secret", std::chrono::minutes(30), 1000);
        clock_ = std::make_shared<FakeClock>();
        identityRepo_ = std::make_shared<adapters::secondary::InMemoryIdentityRepository>();

        authService_ = std::make_shared<application::AuthService>(
            identityRepo_,
            std::make_shared<adapters::secondary::Pbkdf2PasswordHasher>(settings_),
            std::make_shared<adapters::secondary::JwtTokenAdapter>(settings_, clock_)
        );
    }

    SimpleRequest createRequest(const std::string& path, const std::string& body) {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath(path);
        req.setHeader("Content-Type", "application/json");
        req.setBody(body);
        return req;
    }

    std::string loginToken(const std::string& email, const std::string& password) {
        return authService_->login(email, password).accessToken;
    }

    std::shared_ptr<settings::AuthSettings> settings_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<adapters::secondary::InMemoryIdentityRepository> identityRepo_;
    std::shared_ptr<application::AuthService> authService_;
};

// ============================================
// REGISTER HANDLER TESTS
// ============================================

TEST_F(AuthEndpointTest, RegisterHandler_Success) {
    RegisterHandler handler(authService_);

    auto req = createRequest("/api/v1/auth/register",
        R"({"email": "scientist@example.com", "password": "SecurePassword123"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["id"], 1);
    EXPECT_EQ(json["email"], "scientist@example.com");
    EXPECT_FALSE(json.contains("password"));
    EXPECT_FALSE(json.contains("password_hash"));
}

TEST_F(AuthEndpointTest, RegisterHandler_Duplicate_Returns409) {
    authService_->registerUser("a@x.com", "pw1");
    RegisterHandler handler(authService_);

    auto req = createRequest("/api/v1/auth/register", R"({"email": "a@x.com", "password": "pw2"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "DUPLICATE_ACCOUNT");
    EXPECT_EQ(json["message"], "Email already registered");
    EXPECT_EQ(identityRepo_->size(), 1u);
}

TEST_F(AuthEndpointTest, RegisterHandler_MissingFields) {
    RegisterHandler handler(authService_);

    for (const char* body : {R"({"email": "a@x.com"})", R"({"password": "pw"})",
                             R"({"email": "", "password": "pw"})", "{}"}) {
        auto req = createRequest("/api/v1/auth/register", body);
        SimpleResponse res;
        handler.handle(req, res);

        EXPECT_EQ(res.getStatus(), 400) << "body: " << body;
    }
    EXPECT_EQ(identityRepo_->size(), 0u);
}

TEST_F(AuthEndpointTest, RegisterHandler_InvalidJson) {
    RegisterHandler handler(authService_);

    for (const char* body : {"not json", "", "[1, 2]", R"({"email": 5, "password": "pw"})"}) {
        auto req = createRequest("/api/v1/auth/register", body);
        SimpleResponse res;
        handler.handle(req, res);

        EXPECT_EQ(res.getStatus(), 400) << "body: " << body;
    }
}

// ============================================
// LOGIN HANDLER TESTS
// ============================================

TEST_F(AuthEndpointTest, LoginHandler_Success) {
    authService_->registerUser("a@x.com", "pw1");
    LoginHandler handler(authService_);

    auto req = createRequest("/api/v1/auth/login", R"({"email": "a@x.com", "password": "pw1"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["token_type"], "bearer");
    ASSERT_TRUE(json["access_token"].is_string());

    auto auth = authService_->authenticate(json["access_token"].get<std::string>());
    EXPECT_TRUE(auth.success);
    EXPECT_EQ(auth.identity.id, 1);
}

TEST_F(AuthEndpointTest, LoginHandler_WrongPasswordAndUnknownEmail_SameResponse) {
    authService_->registerUser("a@x.com", "pw1");
    LoginHandler handler(authService_);

    auto wrongReq = createRequest("/api/v1/auth/login", R"({"email": "a@x.com", "password": "nope"})");
    SimpleResponse wrongRes;
    handler.handle(wrongReq, wrongRes);

    auto unknownReq = createRequest("/api/v1/auth/login", R"({"email": "b@x.com", "password": "pw1"})");
    SimpleResponse unknownRes;
    handler.handle(unknownReq, unknownRes);

    EXPECT_EQ(wrongRes.getStatus(), 401);
    EXPECT_EQ(unknownRes.getStatus(), 401);
    EXPECT_EQ(wrongRes.getBody(), unknownRes.getBody());

    auto json = nlohmann::json::parse(wrongRes.getBody());
    EXPECT_EQ(json["error"], "INVALID_CREDENTIALS");
    EXPECT_EQ(json["message"], "Incorrect email or password");

    auto challenge = wrongRes.getHeader("WWW-Authenticate");
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(*challenge, "Bearer");
}

TEST_F(AuthEndpointTest, LoginHandler_MissingFields) {
    LoginHandler handler(authService_);

    auto req = createRequest("/api/v1/auth/login", R"({"email": "a@x.com"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AuthEndpointTest, LoginHandler_InvalidJson) {
    LoginHandler handler(authService_);

    auto req = createRequest("/api/v1/auth/login", "email=a@x.com&password=pw1");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================
// VALIDATE TOKEN HANDLER TESTS
// ============================================

TEST_F(AuthEndpointTest, ValidateTokenHandler_ValidToken) {
    authService_->registerUser("a@x.com", "pw1");
    authService_->registerUser("b@x.com", "pw2");
    std::string token = loginToken("b@x.com", "pw2");
    ValidateTokenHandler handler(authService_);

    nlohmann::json body;
    body["token"] = token;
    auto req = createRequest("/api/v1/auth/validate", body.dump());
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_TRUE(json["valid"].get<bool>());
    EXPECT_EQ(json["id"], 2);
    EXPECT_EQ(json["email"], "b@x.com");
    EXPECT_FALSE(json.contains("passwordHash"));
}

TEST_F(AuthEndpointTest, ValidateTokenHandler_ExpiredToken) {
    authService_->registerUser("a@x.com", "pw1");
    std::string token = loginToken("a@x.com", "pw1");
    clock_->advance(std::chrono::hours(1));
    ValidateTokenHandler handler(authService_);

    nlohmann::json body;
    body["token"] = token;
    auto req = createRequest("/api/v1/auth/validate", body.dump());
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_FALSE(json["valid"].get<bool>());
    EXPECT_EQ(json["error"], "INVALID_TOKEN");
    EXPECT_FALSE(json.contains("id"));
}

TEST_F(AuthEndpointTest, ValidateTokenHandler_GarbageToken) {
    ValidateTokenHandler handler(authService_);

    auto req = createRequest("/api/v1/auth/validate", R"({"token": "garbage"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_FALSE(nlohmann::json::parse(res.getBody())["valid"].get<bool>());
}

TEST_F(AuthEndpointTest, ValidateTokenHandler_MissingToken) {
    ValidateTokenHandler handler(authService_);

    auto req = createRequest("/api/v1/auth/validate", "{}");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================
// SERVICE ENDPOINTS
// ============================================

TEST_F(AuthEndpointTest, RootHandler_Welcome) {
    RootHandler handler;

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["message"], "Welcome to Molecule Ledger API!");
}

TEST_F(AuthEndpointTest, HealthHandler_Online) {
    HealthHandler handler;

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["api_status"], "online");
    EXPECT_EQ(json["service"], "ledger-auth-service");

    auto contentType = res.getHeader("Content-Type");
    ASSERT_TRUE(contentType.has_value());
    EXPECT_EQ(*contentType, "application/json");
}

// ============================================
// DIRECTORY FAILURE TESTS
// ============================================

// Сбой хранилища отвечает 500, а не 401/409
TEST_F(AuthEndpointTest, DirectoryFailure_AllEndpointsReturn500) {
    auto failing = std::make_shared<MockAuthService>();
    EXPECT_CALL(*failing, registerUser(_, _))
        .WillOnce(Throw(std::runtime_error("connection lost")));
    EXPECT_CALL(*failing, login(_, _))
        .WillOnce(Throw(std::runtime_error("connection lost")));
    EXPECT_CALL(*failing, authenticate(_))
        .WillOnce(Throw(std::runtime_error("connection lost")));

    const std::string credentials = R"({"email": "a@x.com", "password": "pw1"})";

    RegisterHandler registerHandler(failing);
    auto registerReq = createRequest("/api/v1/auth/register", credentials);
    SimpleResponse registerRes;
    registerHandler.handle(registerReq, registerRes);
    EXPECT_EQ(registerRes.getStatus(), 500);

    LoginHandler loginHandler(failing);
    auto loginReq = createRequest("/api/v1/auth/login", credentials);
    SimpleResponse loginRes;
    loginHandler.handle(loginReq, loginRes);
    EXPECT_EQ(loginRes.getStatus(), 500);

    ValidateTokenHandler validateHandler(failing);
    auto validateReq = createRequest("/api/v1/auth/validate", R"({"token": "any"})");
    SimpleResponse validateRes;
    validateHandler.handle(validateReq, validateRes);
    EXPECT_EQ(validateRes.getStatus(), 500);
    EXPECT_EQ(nlohmann::json::parse(validateRes.getBody())["error"], "Internal server error");
}
