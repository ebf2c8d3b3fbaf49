#pragma once

#include "ports/output/IPendingLoginStore.hpp"
#include "utils/UuidGenerator.hpp"
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace portal::adapters::secondary {

/**
 * @brief In-memory хранилище ожидающих входа гостей
 *
 * Все операции (create/resolve/consume/sweepExpired) идут под одним
 * mutex_, без разделения на читателей и писателей: трафик captive portal
 * небольшой. Ограничения по размеру нет, память держит только
 * периодическая очистка sweepExpired().
 *
 * Часы подменяются в тестах через конструктор.
 */
class InMemoryPendingLoginStore : public ports::output::IPendingLoginStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit InMemoryPendingLoginStore(Clock clock = nullptr)
        : clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); }))
    {
        std::cout << "[InMemoryPendingLoginStore] Created" << std::endl;
    }

    std::string create(const std::string& deviceId, const std::string& apId) override {
        auto now = clock_();

        std::lock_guard<std::mutex> lock(mutex_);
        std::string token = utils::UuidGenerator::generate();
        // Коллизия UUID v4 практически невозможна, но токен не должен переиспользоваться
        while (entries_.count(token) > 0) {
            token = utils::UuidGenerator::generate();
        }
        entries_.emplace(token, domain::PendingLogin(token, deviceId, apId, now));
        return token;
    }

    std::optional<domain::PendingLogin> resolve(const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(token);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool consume(const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(token) > 0;
    }

    size_t sweepExpired(std::chrono::seconds maxAge) override {
        auto now = clock_();
        size_t removed = 0;

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.ageAt(now) > maxAge) {
                std::cout << "[InMemoryPendingLoginStore] Purged entry: " << it->first << std::endl;
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::PendingLogin> entries_;
};

} // namespace portal::adapters::secondary
