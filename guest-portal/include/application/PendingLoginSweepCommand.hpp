#pragma once

#include <ICommand.hpp>
#include "ports/output/IPendingLoginStore.hpp"
#include <chrono>
#include <iostream>
#include <memory>

namespace portal::application {

/**
 * @brief Очистка просроченных записей ожидающих входа гостей
 *
 * Выполняется PeriodicTask'ом (по умолчанию раз в 30 секунд, срок жизни записи 1 час).
 */
class PendingLoginSweepCommand : public ICommand {
public:
    PendingLoginSweepCommand(std::shared_ptr<ports::output::IPendingLoginStore> store,
                             std::chrono::seconds maxAge)
        : store_(std::move(store))
        , maxAge_(maxAge)
    {}

    void execute() override {
        size_t removed = store_->sweepExpired(maxAge_);
        if (removed > 0) {
            std::cout << "[PendingLoginSweep] Removed " << removed
                      << " expired entries, " << store_->size() << " pending" << std::endl;
        }
    }

private:
    std::shared_ptr<ports::output::IPendingLoginStore> store_;
    std::chrono::seconds maxAge_;
};

} // namespace portal::application
