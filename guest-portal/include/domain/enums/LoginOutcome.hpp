#pragma once

#include <string>

namespace portal::domain {

/**
 * @brief Итог обработки формы входа
 *
 * Гость в любом случае перенаправляется на /success,
 * значение нужно для логов и тестов.
 */
enum class LoginOutcome {
    AUTHORIZED,          ///< Контроллер выдал доступ, запись в журнал сделана
    CONTROLLER_FAILED,   ///< Контроллер отказал, запись в журнал всё равно сделана
    UNKNOWN_TOKEN,       ///< Токен пустой, использован или просрочен
    ALREADY_IN_FLIGHT    ///< Параллельная отправка с тем же токеном уже выполняется
};

inline std::string toString(LoginOutcome outcome) {
    switch (outcome) {
        case LoginOutcome::AUTHORIZED: return "AUTHORIZED";
        case LoginOutcome::CONTROLLER_FAILED: return "CONTROLLER_FAILED";
        case LoginOutcome::UNKNOWN_TOKEN: return "UNKNOWN_TOKEN";
        case LoginOutcome::ALREADY_IN_FLIGHT: return "ALREADY_IN_FLIGHT";
        default: return "UNKNOWN";
    }
}

} // namespace portal::domain
