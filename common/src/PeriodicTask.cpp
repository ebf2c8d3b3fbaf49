#include "PeriodicTask.hpp"
#include <iostream>
#include <stdexcept>

PeriodicTask::PeriodicTask(std::string name,
                           std::shared_ptr<ICommand> command,
                           std::chrono::milliseconds interval)
    : name_(std::move(name))
    , command_(std::move(command))
    , interval_(interval)
{
    if (!command_) {
        throw std::invalid_argument("PeriodicTask '" + name_ + "': command is null");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("PeriodicTask '" + name_ + "': interval must be positive");
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
    }

    thread_ = std::thread([this]() { loop(); });
    std::cout << "[PeriodicTask] " << name_ << " started, interval "
              << interval_.count() << "ms" << std::endl;
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    condVar_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        std::cout << "[PeriodicTask] " << name_ << " stopped" << std::endl;
    }
    running_ = false;
}

void PeriodicTask::runOnce() {
    try {
        command_->execute();
    } catch (const std::exception& e) {
        std::cerr << "[PeriodicTask] " << name_ << " failed: " << e.what() << std::endl;
    }
    ++runCount_;
}

bool PeriodicTask::isRunning() const {
    return running_;
}

uint64_t PeriodicTask::runCount() const {
    return runCount_;
}

void PeriodicTask::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        if (condVar_.wait_for(lock, interval_, [this]() { return stopRequested_; })) {
            break;
        }

        // Команда выполняется без удержания mutex_, чтобы stop() не ждал её окончания под локом
        lock.unlock();
        runOnce();
        lock.lock();
    }
}
