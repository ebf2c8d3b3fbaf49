#pragma once

#include "Timestamp.hpp"
#include <string>

namespace portal::domain {

/**
 * @brief Запись журнала о выданном гостевом доступе
 *
 * Формирует ядро, хранением владеет IAuditSink.
 */
struct AuditRecord {
    std::string token;
    std::string deviceId;
    std::string apId;
    std::string displayName;
    std::string email;
    int durationMinutes = 0;
    Timestamp createdAt;
};

} // namespace portal::domain
