#include <gtest/gtest.h>

#include "adapters/secondary/ControllerHttpClient.hpp"
#include "mocks/StubControllerSettings.hpp"
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <thread>

using namespace portal;
using namespace portal::adapters::secondary;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ============================================================================
// Локальный сервер на 127.0.0.1: принимает одно соединение и отдаёт его onAccept
// ============================================================================

class LocalServer {
public:
    using OnAccept = std::function<void(tcp::socket&)>;

    explicit LocalServer(OnAccept onAccept)
        : acceptor_(ioc_, tcp::endpoint(net::ip::address_v4::loopback(), 0))
        , onAccept_(std::move(onAccept))
    {
        acceptor_.async_accept([this](const beast::error_code& ec, tcp::socket socket) {
            if (ec) return;
            accepted_ = std::move(socket);
            onAccept_(accepted_);
        });
        thread_ = std::thread([this]() { ioc_.run(); });
    }

    ~LocalServer() {
        ioc_.stop();
        thread_.join();
    }

    int port() const { return acceptor_.local_endpoint().port(); }

private:
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    tcp::socket accepted_{ioc_};
    OnAccept onAccept_;
    std::thread thread_;
};

// ============================================================================
// Test Fixture
// ============================================================================

class ControllerHttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<tests::mocks::StubControllerSettings>();
        settings_->tlsVerifyDisabled = true;
        settings_->timeout = 1s;
    }

    SimpleRequest loginRequest() {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/api/auth/login");
        req.setHeader("Content-Type", "application/json");
        req.setHeader("Cookie", "TOKEN=jwt");
        req.setBody(R"({"username":"admin","password":"secret"})");
        return req;
    }

    std::shared_ptr<tests::mocks::StubControllerSettings> settings_;
};

// ============================================================================
// ТЕСТЫ: обмен по http
// ============================================================================

TEST_F(ControllerHttpClientTest, Http_ResponseHeadersAndBodyCopied) {
    std::string seenTarget, seenHost, seenCookie, seenBody;
    int port = 0;

    {
        LocalServer server([&](tcp::socket& socket) {
            beast::flat_buffer buffer;
            http::request<http::string_body> request;
            beast::error_code ec;
            http::read(socket, buffer, request, ec);
            if (ec) return;

            seenTarget = std::string(request.target().data(), request.target().size());
            auto host = request[http::field::host];
            seenHost = std::string(host.data(), host.size());
            auto cookie = request[http::field::cookie];
            seenCookie = std::string(cookie.data(), cookie.size());
            seenBody = request.body();

            http::response<http::string_body> response{http::status::ok, 11};
            response.insert("x-csrf-token", "csrf-abc");
            response.insert(http::field::set_cookie, "TOKEN=session; Path=/");
            response.insert(http::field::set_cookie, "unifises=s1; Path=/");
            response.body() = R"({"meta":{"rc":"ok"}})";
            response.prepare_payload();
            http::write(socket, response, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        });

        port = server.port();
        settings_->url = "http://127.0.0.1:" + std::to_string(port);
        ControllerHttpClient client(settings_);

        auto req = loginRequest();
        SimpleResponse res;
        ASSERT_TRUE(client.send(req, res));

        EXPECT_EQ(res.getStatus(), 200);
        EXPECT_EQ(res.getBody(), R"({"meta":{"rc":"ok"}})");
        EXPECT_EQ(res.getHeader("X-Csrf-Token").value_or(""), "csrf-abc");
        EXPECT_EQ(res.getHeader("Set-Cookie").value_or(""), "TOKEN=session; Path=/\nunifises=s1; Path=/");
    }

    EXPECT_EQ(seenTarget, "/api/auth/login");
    EXPECT_EQ(seenHost, "127.0.0.1:" + std::to_string(port));
    EXPECT_EQ(seenCookie, "TOKEN=jwt");
    EXPECT_EQ(seenBody, R"({"username":"admin","password":"secret"})");
}

TEST_F(ControllerHttpClientTest, Http_SilentServer_TimesOut) {
    LocalServer server([](tcp::socket&) {});
    settings_->url = "http://127.0.0.1:" + std::to_string(server.port());
    ControllerHttpClient client(settings_);

    auto req = loginRequest();
    SimpleResponse res;
    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.send(req, res));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 3s);
}

// ============================================================================
// ТЕСТЫ: https и сетевые ошибки
// ============================================================================

TEST_F(ControllerHttpClientTest, Https_NoHandshake_TimesOut) {
    LocalServer server([](tcp::socket&) {});
    settings_->url = "https://127.0.0.1:" + std::to_string(server.port());
    ControllerHttpClient client(settings_);

    auto req = loginRequest();
    SimpleResponse res;
    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.send(req, res));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, 900ms);
    EXPECT_LT(elapsed, 3s);
}

TEST_F(ControllerHttpClientTest, RefusedPort_ReturnsFalse) {
    int freePort = 0;
    {
        net::io_context ioc;
        tcp::acceptor reserve(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
        freePort = reserve.local_endpoint().port();
    }

    for (const char* scheme : {"http", "https"}) {
        settings_->url = std::string(scheme) + "://127.0.0.1:" + std::to_string(freePort);
        ControllerHttpClient client(settings_);

        auto req = loginRequest();
        SimpleResponse res;
        auto begin = std::chrono::steady_clock::now();
        EXPECT_FALSE(client.send(req, res)) << scheme;
        EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s) << scheme;
    }
}

TEST_F(ControllerHttpClientTest, Construct_InvalidSettings_Throw) {
    settings_->url = "ftp://unifi";
    EXPECT_THROW(ControllerHttpClient{settings_}, std::invalid_argument);

    settings_->url = "https://unifi";
    settings_->timeout = 0s;
    EXPECT_THROW(ControllerHttpClient{settings_}, std::invalid_argument);
}

TEST(ControllerHttpClientHeaderTest, CanonicalHeaderName) {
    EXPECT_EQ(ControllerHttpClient::canonicalHeaderName("x-csrf-token"), "X-Csrf-Token");
    EXPECT_EQ(ControllerHttpClient::canonicalHeaderName("CONTENT-TYPE"), "Content-Type");
    EXPECT_EQ(ControllerHttpClient::canonicalHeaderName("etag"), "Etag");
}
