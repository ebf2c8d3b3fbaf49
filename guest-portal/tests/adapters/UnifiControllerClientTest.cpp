#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/UnifiControllerClient.hpp"
#include "mocks/StubControllerSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace portal;
using namespace portal::adapters::secondary;
using portal::domain::AuthorizationStatus;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class UnifiControllerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        httpClient_ = std::make_shared<MockHttpClient>();
        settings_ = std::make_shared<tests::mocks::StubControllerSettings>();
    }

    std::shared_ptr<UnifiControllerClient> makeClient() {
        return std::make_shared<UnifiControllerClient>(httpClient_, settings_);
    }

    // Успешный логин с cookie и CSRF токеном
    static bool loginOk(const IRequest& req, IResponse& res) {
        EXPECT_EQ(req.getMethod(), "POST");
        EXPECT_EQ(req.getPath(), "/api/auth/login");

        auto body = nlohmann::json::parse(req.getBody());
        EXPECT_EQ(body["username"], "admin");
        EXPECT_EQ(body["password"], "secret");

        res.setStatus(200);
        res.setHeader("Set-Cookie", "TOKEN=session-jwt; Path=/; HttpOnly");
        res.setHeader("X-CSRF-Token", "csrf-123");
        res.setBody("{}");
        return true;
    }

    std::shared_ptr<MockHttpClient> httpClient_;
    std::shared_ptr<tests::mocks::StubControllerSettings> settings_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(UnifiControllerClientTest, AuthorizeGuest_BothStepsOk_Authorized) {
    InSequence seq;
    EXPECT_CALL(*httpClient_, send(_, _)).WillOnce(Invoke(&UnifiControllerClientTest::loginOk));
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "POST");
            EXPECT_EQ(req.getPath(), "/proxy/network/api/s/default/cmd/stamgr");
            EXPECT_EQ(req.getHeader("Cookie").value_or(""), "TOKEN=session-jwt");
            EXPECT_EQ(req.getHeader("X-CSRF-Token").value_or(""), "csrf-123");

            auto body = nlohmann::json::parse(req.getBody());
            EXPECT_EQ(body["cmd"], "authorize-guest");
            EXPECT_EQ(body["mac"], "AA:BB:CC:DD:EE:FF");
            EXPECT_EQ(body["ap_mac"], "11:22:33:44:55:66");
            EXPECT_EQ(body["minutes"], 480);

            res.setStatus(200);
            res.setBody(R"({"meta":{"rc":"ok"},"data":[]})");
            return true;
        });

    auto result = makeClient()->authorizeGuest("AA:BB:CC:DD:EE:FF", "11:22:33:44:55:66", 480);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.status, AuthorizationStatus::AUTHORIZED);
}

TEST_F(UnifiControllerClientTest, AuthorizeGuest_LoginRejected_LoginFailedWithoutSecondStep) {
    EXPECT_CALL(*httpClient_, send(_, _))
        .Times(1)
        .WillOnce([](const IRequest&, IResponse& res) {
            res.setStatus(401);
            res.setBody(R"({"error":"invalid credentials"})");
            return true;
        });

    auto result = makeClient()->authorizeGuest("dev", "ap", 60);

    EXPECT_EQ(result.status, AuthorizationStatus::LOGIN_FAILED);
    EXPECT_EQ(result.message, R"({"error":"invalid credentials"})");
}

TEST_F(UnifiControllerClientTest, AuthorizeGuest_AuthorizeRejected_AuthorizationFailed) {
    InSequence seq;
    EXPECT_CALL(*httpClient_, send(_, _)).WillOnce(Invoke(&UnifiControllerClientTest::loginOk));
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) {
            res.setStatus(400);
            res.setBody(R"({"meta":{"rc":"error","msg":"api.err.UnknownStation"}})");
            return true;
        });

    auto result = makeClient()->authorizeGuest("dev", "ap", 60);

    EXPECT_EQ(result.status, AuthorizationStatus::AUTHORIZATION_FAILED);
    EXPECT_NE(result.message.find("UnknownStation"), std::string::npos);
}

TEST_F(UnifiControllerClientTest, AuthorizeGuest_LoginNotDelivered_TransportError) {
    EXPECT_CALL(*httpClient_, send(_, _)).Times(1).WillOnce(Return(false));

    auto result = makeClient()->authorizeGuest("dev", "ap", 60);

    EXPECT_EQ(result.status, AuthorizationStatus::TRANSPORT_ERROR);
}

TEST_F(UnifiControllerClientTest, AuthorizeGuest_AuthorizeNotDelivered_TransportError) {
    InSequence seq;
    EXPECT_CALL(*httpClient_, send(_, _)).WillOnce(Invoke(&UnifiControllerClientTest::loginOk));
    EXPECT_CALL(*httpClient_, send(_, _)).WillOnce(Return(false));

    auto result = makeClient()->authorizeGuest("dev", "ap", 60);

    EXPECT_EQ(result.status, AuthorizationStatus::TRANSPORT_ERROR);
}

TEST_F(UnifiControllerClientTest, AuthorizeGuest_ClientThrows_TransportError) {
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse&) -> bool {
            throw std::runtime_error("handshake: certificate verify failed");
        });

    auto result = makeClient()->authorizeGuest("dev", "ap", 60);

    EXPECT_EQ(result.status, AuthorizationStatus::TRANSPORT_ERROR);
    EXPECT_EQ(result.message, "handshake: certificate verify failed");
}

TEST_F(UnifiControllerClientTest, AuthorizeGuest_LowercaseCsrfHeader_Forwarded) {
    InSequence seq;
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) {
            res.setStatus(200);
            res.setHeader("Set-Cookie", "TOKEN=session-jwt; Path=/");
            res.setHeader("x-csrf-token", "csrf-lower");
            return true;
        });
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getHeader("X-CSRF-Token").value_or(""), "csrf-lower");
            res.setStatus(200);
            return true;
        });

    auto result = makeClient()->authorizeGuest("dev", "ap", 60);

    EXPECT_TRUE(result.ok());
}

TEST_F(UnifiControllerClientTest, AuthorizeGuest_UrlPrefixAndSite_UsedInPaths) {
    settings_->url = "https://gateway.local/unifi/";
    settings_->site = "guests";

    InSequence seq;
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getPath(), "/unifi/api/auth/login");
            res.setStatus(200);
            return true;
        });
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getPath(), "/unifi/proxy/network/api/s/guests/cmd/stamgr");
            // Логин без cookie и CSRF: заголовки не отправляются
            EXPECT_FALSE(req.getHeader("Cookie").has_value());
            EXPECT_FALSE(req.getHeader("X-CSRF-Token").has_value());
            res.setStatus(200);
            return true;
        });

    auto result = makeClient()->authorizeGuest("dev", "ap", 30);

    EXPECT_TRUE(result.ok());
}

TEST_F(UnifiControllerClientTest, Construct_InvalidUrl_Throws) {
    settings_->url = "not a url";

    EXPECT_THROW(makeClient(), std::invalid_argument);
}
