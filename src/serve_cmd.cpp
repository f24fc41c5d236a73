#include "commands.hpp"
#include "app_context.hpp"
#include "reminder_runner.hpp"
#include "async_dispatcher.hpp"
#include "local_time.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

namespace dosewatch {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void report_rearm(const std::vector<RecomputeResult>& results) {
    size_t armed = 0, degenerate = 0;
    for (auto& r : results) {
        if (r.armed) armed++;
        if (r.degenerate()) degenerate++;
    }
    std::cout << "Rearmed " << armed << " of " << results.size() << " dose-time(s)";
    if (degenerate > 0) std::cout << ", " << degenerate << " with no matching weekday";
    std::cout << "\n";
}

int cmd_rearm() {
    AppContext app(Config::load(default_config_path()));
    report_rearm(app.coordinator.rearm_all());
    return 0;
}

int cmd_serve() {
    AppContext app(Config::load(default_config_path()));
    std::cerr << "[serve] Database: " << app.config.database_path() << "\n";
    std::cerr << "[serve] Dispatcher: " << app.dispatcher->name() << "\n";

    report_rearm(app.coordinator.rearm_all());

    ReminderRunner runner(app.dose_times, app.coordinator, [&](const DoseTime& t) {
        auto s = app.schedules.get(t.schedule_id);
        auto m = s ? app.medications.get(s->medication_id) : std::nullopt;
        std::string name = m ? m->name : "(unknown)";
        std::string tz = s ? s->timezone : app.coordinator.default_timezone();
        std::cout << "[due] " << format_local(*t.next_trigger_ts, tz) << " " << name;
        if (t.dosage) std::cout << " " << *t.dosage;
        if (t.instructions) std::cout << " (" << *t.instructions << ")";
        std::cout << " time=" << t.id << std::endl;
    }, app.config.runner.poll_interval_s);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    runner.start();
    std::cerr << "[serve] Ready. Ctrl+C to quit.\n";
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[serve] Shutting down...\n";
    runner.stop();
    if (auto* async = dynamic_cast<AsyncDispatcher*>(app.dispatcher.get())) async->flush();
    std::cerr << "[serve] Done.\n";
    return 0;
}

} // namespace dosewatch
