#include "async_dispatcher.hpp"
#include <iostream>

namespace dosewatch {

AsyncDispatcher::AsyncDispatcher(std::unique_ptr<ReminderDispatcher> inner)
    : inner_(std::move(inner)) {
    worker_ = std::thread(&AsyncDispatcher::run_loop, this);
}

AsyncDispatcher::~AsyncDispatcher() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void AsyncDispatcher::arm(const std::string& reminder_id, int64_t fires_at_ms,
                          const ReminderPayload& payload) {
    submit([this, reminder_id, fires_at_ms, payload]() {
        inner_->arm(reminder_id, fires_at_ms, payload);
    });
}

void AsyncDispatcher::cancel(const std::string& reminder_id) {
    submit([this, reminder_id]() {
        inner_->cancel(reminder_id);
    });
}

void AsyncDispatcher::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && !busy_; });
}

void AsyncDispatcher::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

void AsyncDispatcher::run_loop() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !tasks_.empty() || stop_; });

        // Drain what is queued before honouring stop.
        if (stop_ && tasks_.empty()) break;

        auto task = std::move(tasks_.front());
        tasks_.pop();
        busy_ = true;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[dispatch] " << inner_->name() << " failed: " << e.what() << "\n";
        }

        lock.lock();
        busy_ = false;
        if (tasks_.empty()) idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

} // namespace dosewatch
