#pragma once

#include <string>

namespace portal::domain {

/**
 * @brief Данные формы входа (POST /api/login)
 */
struct GuestLoginRequest {
    std::string token;         ///< cacheId из страницы входа, может быть пустым
    std::string displayName;   ///< username из формы
    std::string email;
};

} // namespace portal::domain
