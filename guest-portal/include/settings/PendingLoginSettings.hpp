#pragma once

#include "settings/EnvReader.hpp"
#include <chrono>
#include <stdexcept>

namespace portal::settings {

/**
 * @brief Настройки кэша ожидающих входа гостей
 *
 * Читает из ENV:
 * - PENDING_LOGIN_TTL_SECONDS (default: 3600)
 * - PENDING_LOGIN_SWEEP_SECONDS (default: 30)
 */
class PendingLoginSettings {
public:
    PendingLoginSettings() {
        ttlSeconds_ = EnvReader::getInt("PENDING_LOGIN_TTL_SECONDS", ttlSeconds_);
        sweepSeconds_ = EnvReader::getInt("PENDING_LOGIN_SWEEP_SECONDS", sweepSeconds_);

        if (ttlSeconds_ <= 0) {
            throw std::invalid_argument("PENDING_LOGIN_TTL_SECONDS must be positive");
        }
        if (sweepSeconds_ <= 0) {
            throw std::invalid_argument("PENDING_LOGIN_SWEEP_SECONDS must be positive");
        }
    }

    std::chrono::seconds getMaxAge() const { return std::chrono::seconds(ttlSeconds_); }
    std::chrono::seconds getSweepInterval() const { return std::chrono::seconds(sweepSeconds_); }

private:
    int ttlSeconds_ = 3600;
    int sweepSeconds_ = 30;
};

} // namespace portal::settings
