#pragma once

#include "ports/input/IGuestAuthorizationService.hpp"
#include "ports/output/IPendingLoginStore.hpp"
#include "ports/output/IControllerAuthClient.hpp"
#include "ports/output/IAuditSink.hpp"
#include "settings/IControllerSettings.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace portal::application {

/**
 * @brief Завершение входа гостя
 *
 * Порядок: resolve → authorizeGuest → запись в журнал → consume.
 * Запись в журнал делается и при отказе контроллера, гость в любом
 * случае уходит на /success.
 *
 * inFlight_ не даёт двум параллельным отправкам одного токена
 * дважды вызвать контроллер: вторая видит токен занятым и ничего не делает.
 */
class GuestAuthorizationService : public ports::input::IGuestAuthorizationService {
public:
    GuestAuthorizationService(
        std::shared_ptr<ports::output::IPendingLoginStore> store,
        std::shared_ptr<ports::output::IControllerAuthClient> controller,
        std::shared_ptr<ports::output::IAuditSink> auditSink,
        std::shared_ptr<settings::IControllerSettings> settings
    ) : store_(std::move(store))
      , controller_(std::move(controller))
      , auditSink_(std::move(auditSink))
      , settings_(std::move(settings))
    {}

    domain::LoginOutcome completeLogin(const domain::GuestLoginRequest& request) override {
        if (request.token.empty()) {
            std::cout << "[GuestAuthorizationService] Empty cacheId, skipping authorization" << std::endl;
            return domain::LoginOutcome::UNKNOWN_TOKEN;
        }

        if (!tryAcquire(request.token)) {
            std::cout << "[GuestAuthorizationService] Token already in flight: " << request.token << std::endl;
            return domain::LoginOutcome::ALREADY_IN_FLIGHT;
        }
        InFlightGuard guard(*this, request.token);

        auto pending = store_->resolve(request.token);
        if (!pending) {
            std::cout << "[GuestAuthorizationService] Unknown or expired cacheId: " << request.token << std::endl;
            return domain::LoginOutcome::UNKNOWN_TOKEN;
        }

        int duration = settings_->getDurationMinutes();
        auto result = controller_->authorizeGuest(pending->deviceId, pending->apId, duration);
        if (!result.ok()) {
            std::cerr << "[GuestAuthorizationService] Controller refused " << pending->deviceId
                      << ": " << domain::toString(result.status) << " " << result.message << std::endl;
        }

        domain::AuditRecord record;
        record.token = pending->token;
        record.deviceId = pending->deviceId;
        record.apId = pending->apId;
        record.displayName = request.displayName;
        record.email = request.email;
        record.durationMinutes = duration;
        record.createdAt = domain::Timestamp::now();

        try {
            auditSink_->record(record);
        } catch (const std::exception& e) {
            std::cerr << "[GuestAuthorizationService] Audit write failed for "
                      << record.token << ": " << e.what() << std::endl;
        }

        store_->consume(request.token);

        return result.ok() ? domain::LoginOutcome::AUTHORIZED
                           : domain::LoginOutcome::CONTROLLER_FAILED;
    }

private:
    std::shared_ptr<ports::output::IPendingLoginStore> store_;
    std::shared_ptr<ports::output::IControllerAuthClient> controller_;
    std::shared_ptr<ports::output::IAuditSink> auditSink_;
    std::shared_ptr<settings::IControllerSettings> settings_;

    std::mutex inFlightMutex_;
    std::unordered_set<std::string> inFlight_;

    bool tryAcquire(const std::string& token) {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        return inFlight_.insert(token).second;
    }

    void release(const std::string& token) {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        inFlight_.erase(token);
    }

    struct InFlightGuard {
        GuestAuthorizationService& owner;
        std::string token;

        InFlightGuard(GuestAuthorizationService& o, std::string t) : owner(o), token(std::move(t)) {}
        ~InFlightGuard() { owner.release(token); }
    };
};

} // namespace portal::application
