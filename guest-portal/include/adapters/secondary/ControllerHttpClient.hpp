#pragma once

#include "settings/IControllerSettings.hpp"
#include "utils/Url.hpp"
#include <IHttpClient.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <chrono>
#include <memory>

namespace boost::asio::ssl {
class context;
}

namespace portal::adapters::secondary {

/**
 * @brief HTTP(S) клиент к контроллеру UniFi (Boost.Beast + OpenSSL)
 *
 * Привязан к хосту и порту из UNIFI_URL; из запроса берутся метод, путь,
 * заголовки и тело. Каждый send() открывает новое соединение, для https
 * поверх него TLS.
 *
 * Проверка сертификата отключается DISABLE_TLS=true: контроллеры в локальной
 * сети обычно работают с самоподписанным сертификатом. Иначе сертификат
 * проверяется по системному хранилищу (и UNIFI_CA_FILE, если задан) вместе с
 * именем хоста.
 *
 * Каждый этап (resolve, connect, handshake, write, read) ограничен
 * таймаутом UNIFI_TIMEOUT_SECONDS, чтобы медленный контроллер не занимал
 * рабочие потоки HTTP сервера.
 *
 * Несколько заголовков Set-Cookie склеиваются в один через '\n'.
 * Имена заголовков ответа приводятся к каноничному виду ("x-csrf-token"
 * → "X-Csrf-Token"), поиск по имени см. UnifiControllerClient.
 */
class ControllerHttpClient : public IHttpClient {
public:
    explicit ControllerHttpClient(std::shared_ptr<settings::IControllerSettings> settings);
    ~ControllerHttpClient() override;

    ControllerHttpClient(const ControllerHttpClient&) = delete;
    ControllerHttpClient& operator=(const ControllerHttpClient&) = delete;

    /**
     * @return false если ответ не получен (DNS, TCP, TLS, таймаут)
     */
    bool send(const IRequest& req, IResponse& res) override;

    /**
     * @brief "content-type" → "Content-Type"
     */
    static std::string canonicalHeaderName(const std::string& name);

private:
    std::shared_ptr<settings::IControllerSettings> settings_;
    utils::Url url_;
    std::chrono::seconds timeout_;
    bool verifyPeer_;
    std::unique_ptr<boost::asio::ssl::context> sslContext_;

    void exchange(const IRequest& req, IResponse& res);
};

} // namespace portal::adapters::secondary
