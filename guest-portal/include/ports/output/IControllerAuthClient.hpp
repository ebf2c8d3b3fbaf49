#pragma once

#include "domain/AuthorizationResult.hpp"
#include <string>

namespace portal::ports::output {

/**
 * @brief Клиент контроллера UniFi
 *
 * Каждый вызов выполняет свежий вход (cookie + CSRF) и сразу команду
 * authorize-guest. Сессия между гостями не переиспользуется, повторов нет.
 */
class IControllerAuthClient {
public:
    virtual ~IControllerAuthClient() = default;

    /**
     * @brief Выдать гостю доступ на durationMinutes минут
     * @param deviceId MAC клиента
     * @param apId MAC точки доступа
     */
    virtual domain::AuthorizationResult authorizeGuest(
        const std::string& deviceId,
        const std::string& apId,
        int durationMinutes) = 0;
};

} // namespace portal::ports::output
