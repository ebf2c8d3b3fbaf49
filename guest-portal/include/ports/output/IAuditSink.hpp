#pragma once

#include "domain/AuditRecord.hpp"

namespace portal::ports::output {

/**
 * @brief Журнал выданных гостевых доступов (только запись)
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /**
     * @throws std::exception при ошибке записи
     */
    virtual void record(const domain::AuditRecord& record) = 0;
};

} // namespace portal::ports::output
