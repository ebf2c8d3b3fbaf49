#pragma once

#include "domain/GuestLoginRequest.hpp"
#include "domain/enums/LoginOutcome.hpp"

namespace portal::ports::input {

/**
 * @brief Обработка отправленной формы входа гостя
 */
class IGuestAuthorizationService {
public:
    virtual ~IGuestAuthorizationService() = default;

    /**
     * @brief resolve → authorizeGuest → запись в журнал → consume
     *
     * Не бросает исключений из-за контроллера или журнала: гость
     * всё равно попадает на страницу успеха.
     */
    virtual domain::LoginOutcome completeLogin(const domain::GuestLoginRequest& request) = 0;
};

} // namespace portal::ports::input
