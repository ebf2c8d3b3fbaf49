#pragma once

#include "settings/IControllerSettings.hpp"
#include "settings/EnvReader.hpp"
#include "utils/Url.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace portal::settings {

/**
 * @brief Настройки подключения к контроллеру UniFi
 *
 * Читает из ENV:
 * - UNIFI_URL (default: "https://unifi")
 * - UNIFI_SITE (default: "default")
 * - UNIFI_USERNAME, UNIFI_PASSWORD
 * - UNIFI_DURATION: минуты гостевого доступа (default: 480)
 * - DISABLE_TLS: не проверять сертификат контроллера (default: false)
 * - UNIFI_TIMEOUT_SECONDS (default: 10)
 * - UNIFI_CA_FILE: дополнительный CA для самоподписанного сертификата
 *
 * @throws std::invalid_argument при некорректном URL, длительности или таймауте
 */
class ControllerSettings : public IControllerSettings {
public:
    ControllerSettings() {
        url_ = EnvReader::getString("UNIFI_URL", url_);
        site_ = EnvReader::getString("UNIFI_SITE", site_);
        username_ = EnvReader::getString("UNIFI_USERNAME", "");
        password_ = EnvReader::getString("UNIFI_PASSWORD", "");
        durationMinutes_ = EnvReader::getInt("UNIFI_DURATION", durationMinutes_);
        tlsVerifyDisabled_ = EnvReader::getBool("DISABLE_TLS", false);
        timeoutSeconds_ = EnvReader::getInt("UNIFI_TIMEOUT_SECONDS", timeoutSeconds_);
        caFile_ = EnvReader::getString("UNIFI_CA_FILE", "");

        // Проверяем URL сразу, чтобы не узнать об ошибке на первом госте
        utils::Url::parse(url_);

        if (durationMinutes_ <= 0) {
            throw std::invalid_argument("UNIFI_DURATION must be positive");
        }
        if (timeoutSeconds_ <= 0) {
            throw std::invalid_argument("UNIFI_TIMEOUT_SECONDS must be positive");
        }
        if (username_.empty()) {
            std::cerr << "[ControllerSettings] Warning: UNIFI_USERNAME is empty" << std::endl;
        }
        if (tlsVerifyDisabled_) {
            std::cout << "[ControllerSettings] TLS certificate verification is DISABLED" << std::endl;
        }
    }

    std::string getUrl() const override { return url_; }
    std::string getSite() const override { return site_; }
    std::string getUsername() const override { return username_; }
    std::string getPassword() const override { return password_; }
    int getDurationMinutes() const override { return durationMinutes_; }
    bool isTlsVerifyDisabled() const override { return tlsVerifyDisabled_; }
    std::chrono::seconds getTimeout() const override { return std::chrono::seconds(timeoutSeconds_); }
    std::string getCaFile() const override { return caFile_; }

private:
    std::string url_ = "https://unifi";
    std::string site_ = "default";
    std::string username_;
    std::string password_;
    int durationMinutes_ = 480;
    bool tlsVerifyDisabled_ = false;
    int timeoutSeconds_ = 10;
    std::string caFile_;
};

} // namespace portal::settings
