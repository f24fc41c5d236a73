#pragma once
#include "reminder_dispatcher.hpp"
#include <memory>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace dosewatch {

// Runs an inner dispatcher on a worker thread so a data write never waits
// on platform I/O. Failures are logged on the worker; the next recompute
// re-arms.
class AsyncDispatcher : public ReminderDispatcher {
public:
    explicit AsyncDispatcher(std::unique_ptr<ReminderDispatcher> inner);
    ~AsyncDispatcher() override;

    AsyncDispatcher(const AsyncDispatcher&) = delete;
    AsyncDispatcher& operator=(const AsyncDispatcher&) = delete;

    std::string name() const override { return "async:" + inner_->name(); }
    void arm(const std::string& reminder_id, int64_t fires_at_ms,
             const ReminderPayload& payload) override;
    void cancel(const std::string& reminder_id) override;

    // Blocks until every queued call has run.
    void flush();

private:
    std::unique_ptr<ReminderDispatcher> inner_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool stop_ = false;
    bool busy_ = false;
    std::thread worker_;

    void submit(std::function<void()> task);
    void run_loop();
};

} // namespace dosewatch
