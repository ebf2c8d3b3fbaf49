#pragma once

#include "enums/AuthorizationStatus.hpp"
#include <string>

namespace portal::domain {

/**
 * @brief Результат авторизации гостя на контроллере
 *
 * Для LOGIN_FAILED и AUTHORIZATION_FAILED message содержит тело ответа
 * контроллера, для TRANSPORT_ERROR текст исключения.
 */
struct AuthorizationResult {
    AuthorizationStatus status = AuthorizationStatus::TRANSPORT_ERROR;
    std::string message;

    bool ok() const { return status == AuthorizationStatus::AUTHORIZED; }

    static AuthorizationResult authorized() {
        return {AuthorizationStatus::AUTHORIZED, ""};
    }

    static AuthorizationResult failure(AuthorizationStatus status, std::string message) {
        return {status, std::move(message)};
    }
};

} // namespace portal::domain
