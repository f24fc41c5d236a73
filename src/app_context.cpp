#include "app_context.hpp"
#include "async_dispatcher.hpp"
#include "webhook_dispatcher.hpp"
#include <iostream>

namespace dosewatch {

std::unique_ptr<ReminderDispatcher> make_dispatcher(const DispatcherConfig& cfg) {
    std::unique_ptr<ReminderDispatcher> inner;
    if (cfg.type == "none") {
        return std::make_unique<NullDispatcher>();
    } else if (cfg.type == "webhook") {
        inner = std::make_unique<WebhookDispatcher>(cfg.url, cfg.headers, cfg.timeout_s);
    } else {
        if (cfg.type != "log") {
            std::cerr << "[config] Warning: unknown dispatcher '" << cfg.type << "', using log\n";
        }
        inner = std::make_unique<LogDispatcher>();
    }

    if (cfg.async) return std::make_unique<AsyncDispatcher>(std::move(inner));
    return inner;
}

AppContext::AppContext(Config cfg)
    : config(std::move(cfg))
    , db(config.database_path())
    , medications(db)
    , schedules(db)
    , dose_times(db)
    , intake(db)
    , dispatcher(make_dispatcher(config.dispatcher))
    , coordinator(db, medications, schedules, dose_times, *dispatcher)
{
    coordinator.set_default_timezone(config.resolve_timezone());
}

} // namespace dosewatch
