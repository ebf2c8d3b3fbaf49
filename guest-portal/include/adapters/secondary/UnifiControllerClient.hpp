#pragma once

#include "ports/output/IControllerAuthClient.hpp"
#include "settings/IControllerSettings.hpp"
#include "utils/CookieJar.hpp"
#include "utils/Url.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>

namespace portal::adapters::secondary {

/**
 * @brief HTTP клиент к контроллеру UniFi (UniFi OS)
 *
 * Авторизация гостя в два шага:
 * 1. POST {url}/api/auth/login → cookie сессии + заголовок X-CSRF-Token
 * 2. POST {url}/proxy/network/api/s/{site}/cmd/stamgr, команда authorize-guest
 *
 * Сессия живёт только внутри одного вызова authorizeGuest(), общего
 * изменяемого состояния нет, поэтому вызовы из разных потоков безопасны.
 */
class UnifiControllerClient : public ports::output::IControllerAuthClient {
public:
    UnifiControllerClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IControllerSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
      , url_(utils::Url::parse(settings_->getUrl()))
    {
        std::cout << "[UnifiControllerClient] Created, target: "
                  << url_.scheme << "://" << url_.hostHeader() << url_.basePath
                  << ", site: " << settings_->getSite() << std::endl;
    }

    domain::AuthorizationResult authorizeGuest(
        const std::string& deviceId,
        const std::string& apId,
        int durationMinutes) override
    {
        try {
            // Шаг 1: вход на контроллер
            utils::CookieJar cookies;
            std::string csrfToken;
            auto loginFailure = login(cookies, csrfToken);
            if (loginFailure) {
                return *loginFailure;
            }

            // Шаг 2: команда authorize-guest с cookie и CSRF токеном из шага 1
            nlohmann::json command = {
                {"cmd", "authorize-guest"},
                {"mac", deviceId},
                {"minutes", durationMinutes},
                {"ap_mac", apId}
            };

            SimpleRequest request(
                "POST",
                url_.basePath + "/proxy/network/api/s/" + settings_->getSite() + "/cmd/stamgr",
                command.dump(),
                url_.host,
                url_.port,
                {{"Content-Type", "application/json"}}
            );
            if (!cookies.empty()) {
                request.setHeader("Cookie", cookies.toCookieHeader());
            }
            if (!csrfToken.empty()) {
                request.setHeader("X-CSRF-Token", csrfToken);
            }

            SimpleResponse response;
            if (!httpClient_->send(request, response)) {
                return domain::AuthorizationResult::failure(
                    domain::AuthorizationStatus::TRANSPORT_ERROR,
                    "authorize-guest request was not delivered");
            }

            if (response.getStatus() != 200) {
                std::cerr << "[UnifiControllerClient] authorize-guest failed: "
                          << response.getStatus() << " " << response.getBody() << std::endl;
                return domain::AuthorizationResult::failure(
                    domain::AuthorizationStatus::AUTHORIZATION_FAILED, response.getBody());
            }

            std::cout << "[UnifiControllerClient] Guest " << deviceId << " authorized for "
                      << durationMinutes << " minutes" << std::endl;
            return domain::AuthorizationResult::authorized();

        } catch (const std::exception& e) {
            std::cerr << "[UnifiControllerClient] Error: " << e.what() << std::endl;
            return domain::AuthorizationResult::failure(
                domain::AuthorizationStatus::TRANSPORT_ERROR, e.what());
        }
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IControllerSettings> settings_;
    utils::Url url_;

    /**
     * @return nullopt при успехе, иначе результат с ошибкой
     */
    std::optional<domain::AuthorizationResult> login(utils::CookieJar& cookies, std::string& csrfToken)
    {
        nlohmann::json credentials = {
            {"username", settings_->getUsername()},
            {"password", settings_->getPassword()}
        };

        SimpleRequest request(
            "POST",
            url_.basePath + "/api/auth/login",
            credentials.dump(),
            url_.host,
            url_.port,
            {{"Content-Type", "application/json"}}
        );

        SimpleResponse response;
        if (!httpClient_->send(request, response)) {
            return domain::AuthorizationResult::failure(
                domain::AuthorizationStatus::TRANSPORT_ERROR,
                "login request was not delivered");
        }

        if (response.getStatus() != 200) {
            std::cerr << "[UnifiControllerClient] Login failed: "
                      << response.getStatus() << " " << response.getBody() << std::endl;
            return domain::AuthorizationResult::failure(
                domain::AuthorizationStatus::LOGIN_FAILED, response.getBody());
        }

        if (auto setCookie = response.getHeader("Set-Cookie")) {
            cookies.addSetCookieHeader(*setCookie);
        }
        csrfToken = findCsrfToken(response);

        if (cookies.empty()) {
            std::cerr << "[UnifiControllerClient] Warning: login returned no session cookie" << std::endl;
        }
        return std::nullopt;
    }

    // Контроллеры отдают заголовок в разном регистре
    static std::string findCsrfToken(SimpleResponse& response) {
        for (const char* name : {"X-CSRF-Token", "X-Csrf-Token", "x-csrf-token"}) {
            if (auto value = response.getHeader(name)) {
                return *value;
            }
        }
        return "";
    }
};

} // namespace portal::adapters::secondary
