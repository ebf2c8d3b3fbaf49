#include "adapters/secondary/ControllerHttpClient.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace portal::adapters::secondary {

namespace {

/**
 * @brief Выполнить поставленные в ioc асинхронные операции до конца
 * @throws beast::system_error если операция завершилась с ошибкой
 */
void runStep(net::io_context& ioc, const beast::error_code& ec, const char* step)
{
    ioc.restart();
    ioc.run();
    if (ec) {
        throw beast::system_error(ec, step);
    }
}

// resolve не управляется таймаутом tcp_stream, поэтому ограничиваем run_for
tcp::resolver::results_type resolve(net::io_context& ioc, const utils::Url& url,
                                    std::chrono::seconds timeout)
{
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    tcp::resolver::results_type endpoints;
    bool resolved = false;

    resolver.async_resolve(url.host, std::to_string(url.port),
        [&](const beast::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            resolved = true;
        });
    ioc.run_for(timeout);
    if (!resolved) {
        resolver.cancel();
        ioc.restart();
        ioc.run();
        throw std::runtime_error("resolve: timed out after " + std::to_string(timeout.count()) + "s");
    }
    if (ec) {
        throw beast::system_error(ec, "resolve");
    }
    return endpoints;
}

template <class Stream>
void writeAndRead(net::io_context& ioc, Stream& stream, const utils::Url& url,
                  std::chrono::seconds timeout, const IRequest& req, IResponse& res)
{
    http::verb verb = http::string_to_verb(req.getMethod());
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + req.getMethod());
    }

    http::request<http::string_body> request{verb, req.getPath(), 11};
    request.set(http::field::host, url.hostHeader());
    request.set(http::field::user_agent, "unifi-guest-portal");
    for (const auto& [name, value] : req.getHeaders()) {
        request.set(name, value);
    }
    request.body() = req.getBody();
    request.prepare_payload();

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, request,
        [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    runStep(ioc, ec, "write");

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, response,
        [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    runStep(ioc, ec, "read");

    std::string setCookie;
    for (const auto& field : response) {
        std::string value(field.value().data(), field.value().size());
        if (field.name() == http::field::set_cookie) {
            if (!setCookie.empty()) setCookie += '\n';
            setCookie += value;
        } else {
            std::string name(field.name_string().data(), field.name_string().size());
            res.setHeader(ControllerHttpClient::canonicalHeaderName(name), value);
        }
    }
    if (!setCookie.empty()) {
        res.setHeader("Set-Cookie", setCookie);
    }
    res.setStatus(response.result_int());
    res.setBody(response.body());
}

} // namespace

ControllerHttpClient::ControllerHttpClient(std::shared_ptr<settings::IControllerSettings> settings)
    : settings_(std::move(settings))
    , url_(utils::Url::parse(settings_->getUrl()))
    , timeout_(settings_->getTimeout())
    , verifyPeer_(!settings_->isTlsVerifyDisabled())
{
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("ControllerHttpClient: timeout must be positive");
    }

    if (url_.isHttps()) {
        sslContext_ = std::make_unique<ssl::context>(ssl::context::tls_client);
        sslContext_->set_options(ssl::context::default_workarounds |
                                 ssl::context::no_sslv2 |
                                 ssl::context::no_sslv3);

        if (verifyPeer_) {
            sslContext_->set_default_verify_paths();
            if (!settings_->getCaFile().empty()) {
                sslContext_->load_verify_file(settings_->getCaFile());
            }
            sslContext_->set_verify_mode(ssl::verify_peer);
        } else {
            sslContext_->set_verify_mode(ssl::verify_none);
        }
    }

    std::cout << "[ControllerHttpClient] Created, target: " << url_.scheme << "://" << url_.hostHeader()
              << (url_.isHttps() ? (verifyPeer_ ? ", verify: on" : ", verify: off") : "")
              << ", timeout: " << timeout_.count() << "s" << std::endl;
}

ControllerHttpClient::~ControllerHttpClient() = default;

std::string ControllerHttpClient::canonicalHeaderName(const std::string& name)
{
    std::string result = name;
    bool upper = true;
    for (auto& c : result) {
        unsigned char uc = static_cast<unsigned char>(c);
        c = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
        upper = (c == '-');
    }
    return result;
}

bool ControllerHttpClient::send(const IRequest& req, IResponse& res)
{
    try {
        exchange(req, res);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ControllerHttpClient] " << req.getMethod() << " " << req.getPath()
                  << " failed: " << e.what() << std::endl;
        return false;
    }
}

void ControllerHttpClient::exchange(const IRequest& req, IResponse& res)
{
    net::io_context ioc;
    auto endpoints = resolve(ioc, url_, timeout_);
    beast::error_code ec;

    if (!url_.isHttps()) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout_);
        stream.async_connect(endpoints,
            [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
        runStep(ioc, ec, "connect");

        writeAndRead(ioc, stream, url_, timeout_, req, res);

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return;
    }

    ssl::stream<beast::tcp_stream> stream(ioc, *sslContext_);

    // SNI: без него контроллеры за reverse proxy отдают чужой сертификат
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url_.host.c_str())) {
        beast::error_code sniError(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        throw beast::system_error(sniError, "SNI");
    }
    if (verifyPeer_) {
        stream.set_verify_callback(ssl::host_name_verification(url_.host));
    }

    beast::get_lowest_layer(stream).expires_after(timeout_);
    beast::get_lowest_layer(stream).async_connect(endpoints,
        [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
    runStep(ioc, ec, "connect");

    beast::get_lowest_layer(stream).expires_after(timeout_);
    stream.async_handshake(ssl::stream_base::client,
        [&ec](const beast::error_code& e) { ec = e; });
    runStep(ioc, ec, "handshake");

    writeAndRead(ioc, stream, url_, timeout_, req, res);

    // Ответ уже получен: ошибка закрытия TLS на результат не влияет
    beast::get_lowest_layer(stream).expires_after(timeout_);
    stream.async_shutdown([&ec](const beast::error_code& e) { ec = e; });
    ioc.restart();
    ioc.run();
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        std::cerr << "[ControllerHttpClient] TLS shutdown: " << ec.message() << std::endl;
    }
}

} // namespace portal::adapters::secondary
