#pragma once
#include "dose_time_store.hpp"
#include "reminder_coordinator.hpp"
#include "utils.hpp"
#include <functional>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>

namespace dosewatch {

// Finds dose-times whose cached trigger has passed, reports those with
// reminders enabled, and recomputes them so the next occurrence gets armed.
class ReminderRunner {
public:
    ReminderRunner(DoseTimeStore& dose_times, ReminderCoordinator& coordinator,
                   std::function<void(const DoseTime&)> on_due,
                   int poll_interval_s = 30, Clock clock = epoch_now_ms)
        : dose_times_(dose_times), coordinator_(coordinator), on_due_(std::move(on_due))
        , poll_interval_s_(poll_interval_s), clock_(std::move(clock)) {}

    ~ReminderRunner() { stop(); }

    void start() {
        if (running_.exchange(true)) return;
        thread_ = std::thread(&ReminderRunner::run_loop, this);
    }

    void stop() {
        running_ = false;
        if (thread_.joinable()) thread_.join();
    }

    // One pass; returns how many dose-times were reported. Lapsed rows of
    // muted schedules are only advanced.
    size_t tick() {
        int64_t now = clock_();
        auto due = dose_times_.list_due(now);
        std::vector<std::string> ids;
        for (auto& t : dose_times_.list_due(now, false)) ids.push_back(t.id);
        for (auto& t : due) {
            try {
                on_due_(t);
            } catch (const std::exception& e) {
                std::cerr << "[runner] Due handler failed for " << t.id << ": " << e.what() << "\n";
            }
            ids.push_back(t.id);
        }
        if (!ids.empty()) coordinator_.recompute(ids);
        return due.size();
    }

private:
    DoseTimeStore& dose_times_;
    ReminderCoordinator& coordinator_;
    std::function<void(const DoseTime&)> on_due_;
    int poll_interval_s_;
    Clock clock_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    void run_loop() {
        std::cerr << "[runner] Started (interval=" << poll_interval_s_ << "s)\n";
        while (running_) {
            try {
                tick();
            } catch (const std::exception& e) {
                std::cerr << "[runner] Error: " << e.what() << "\n";
            }
            for (int i = 0; i < poll_interval_s_ * 10 && running_; i++) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
        std::cerr << "[runner] Stopped\n";
    }
};

} // namespace dosewatch
