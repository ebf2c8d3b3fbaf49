#pragma once

#include "ICommand.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @file PeriodicTask.hpp
 * @brief Периодическое выполнение команды в фоновом потоке
 * @details
 * Поток ждёт на condition_variable, поэтому stop() прерывает ожидание
 * сразу, а не через interval. Исключение из команды логируется,
 * следующий тик выполняется по расписанию.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name,
                 std::shared_ptr<ICommand> command,
                 std::chrono::milliseconds interval);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Запустить фоновый поток (повторный вызов игнорируется)
     */
    void start();

    /**
     * @brief Остановить поток и дождаться его завершения
     */
    void stop();

    /**
     * @brief Выполнить команду синхронно в текущем потоке (для тестов)
     */
    void runOnce();

    bool isRunning() const;
    uint64_t runCount() const;
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void loop();

    std::string name_;
    std::shared_ptr<ICommand> command_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runCount_{0};

    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool stopRequested_ = false;
    std::thread thread_;
};
