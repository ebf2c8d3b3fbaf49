#pragma once

#include <string>
#include <chrono>

namespace portal::domain {

/**
 * @brief Гость, ожидающий подтверждения на странице входа
 *
 * Создаётся при редиректе captive portal (параметры id/ap),
 * поля после создания не меняются. Живёт до consume() или до
 * очистки по возрасту.
 */
struct PendingLogin {
    std::string token;      ///< Непрозрачный UUID, вставляется в страницу входа
    std::string deviceId;   ///< MAC клиента из параметра id
    std::string apId;       ///< MAC точки доступа из параметра ap
    std::chrono::system_clock::time_point createdAt;

    PendingLogin() = default;

    PendingLogin(std::string token,
                 std::string deviceId,
                 std::string apId,
                 std::chrono::system_clock::time_point createdAt)
        : token(std::move(token))
        , deviceId(std::move(deviceId))
        , apId(std::move(apId))
        , createdAt(createdAt)
    {}

    /**
     * @brief Возраст записи относительно now
     */
    std::chrono::system_clock::duration ageAt(std::chrono::system_clock::time_point now) const {
        return now - createdAt;
    }
};

} // namespace portal::domain
