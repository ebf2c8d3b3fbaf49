#pragma once

#include "domain/PendingLogin.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace portal::ports::output {

/**
 * @brief Хранилище ожидающих входа гостей
 *
 * Связывает неаутентифицированный редирект captive portal с последующей
 * отправкой формы. Все операции потокобезопасны.
 */
class IPendingLoginStore {
public:
    virtual ~IPendingLoginStore() = default;

    /**
     * @brief Создать запись и вернуть новый токен
     */
    virtual std::string create(const std::string& deviceId, const std::string& apId) = 0;

    /**
     * @brief Найти запись по токену, не удаляя её
     * @return nullopt если токен неизвестен, уже использован или удалён очисткой
     */
    virtual std::optional<domain::PendingLogin> resolve(const std::string& token) = 0;

    /**
     * @brief Удалить запись
     * @return false если записи уже нет (повторная отправка формы), это не ошибка
     */
    virtual bool consume(const std::string& token) = 0;

    /**
     * @brief Удалить все записи старше maxAge
     * @return количество удалённых записей
     */
    virtual size_t sweepExpired(std::chrono::seconds maxAge) = 0;

    virtual size_t size() const = 0;
};

} // namespace portal::ports::output
