#pragma once

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace portal::utils {

/**
 * @brief Разобранный базовый URL контроллера
 *
 * Поддерживаются только http и https. Путь без завершающего '/',
 * чтобы к нему можно было дописывать "/api/auth/login".
 */
struct Url {
    std::string scheme;     ///< "http" или "https"
    std::string host;
    int port = 0;
    std::string basePath;   ///< "" или "/prefix"

    bool isHttps() const { return scheme == "https"; }

    /**
     * @brief Host для заголовка Host (порт опускается, если он стандартный)
     *
     * IPv6 литерал возвращается в квадратных скобках: "[fd00::1]:8443".
     */
    std::string hostHeader() const {
        std::string name = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        bool defaultPort = (isHttps() && port == 443) || (!isHttps() && port == 80);
        return defaultPort ? name : name + ":" + std::to_string(port);
    }

    /**
     * @throws std::invalid_argument если схема не http/https или нет хоста
     */
    static Url parse(const std::string& raw) {
        auto schemeEnd = raw.find("://");
        if (schemeEnd == std::string::npos) {
            throw std::invalid_argument("URL without scheme: '" + raw + "'");
        }

        Url url;
        url.scheme = raw.substr(0, schemeEnd);
        std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (url.scheme != "http" && url.scheme != "https") {
            throw std::invalid_argument("Unsupported URL scheme: '" + url.scheme + "'");
        }

        std::string rest = raw.substr(schemeEnd + 3);
        auto pathStart = rest.find('/');
        std::string authority = rest.substr(0, pathStart);
        url.basePath = (pathStart == std::string::npos) ? "" : rest.substr(pathStart);
        while (!url.basePath.empty() && url.basePath.back() == '/') {
            url.basePath.pop_back();
        }

        url.port = url.isHttps() ? 443 : 80;
        auto colon = authority.rfind(':');
        // IPv6 литерал "[::1]:8443": двоеточие порта идёт после закрывающей скобки
        auto bracket = authority.rfind(']');
        if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
            std::string portStr = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
            size_t consumed = 0;
            try {
                url.port = std::stoi(portStr, &consumed);
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid port in URL: '" + raw + "'");
            }
            if (consumed != portStr.size()) {
                throw std::invalid_argument("Invalid port in URL: '" + raw + "'");
            }
            if (url.port <= 0 || url.port > 65535) {
                throw std::invalid_argument("Port out of range in URL: '" + raw + "'");
            }
        }

        if (authority.size() >= 2 && authority.front() == '[' && authority.back() == ']') {
            authority = authority.substr(1, authority.size() - 2);
        }
        if (authority.empty()) {
            throw std::invalid_argument("URL without host: '" + raw + "'");
        }
        url.host = authority;

        return url;
    }
};

} // namespace portal::utils
