#pragma once
#include "reminder_dispatcher.hpp"
#include <string>
#include <map>

namespace dosewatch {

// Posts arm/cancel requests as JSON to an HTTP endpoint that owns the
// actual notification delivery:
//   {"action":"arm","reminder_id":..,"fires_at":..,"payload":{..}}
//   {"action":"cancel","reminder_id":..}
class WebhookDispatcher : public ReminderDispatcher {
public:
    WebhookDispatcher(const std::string& url,
                      std::map<std::string, std::string> headers = {},
                      int timeout_s = 10);

    std::string name() const override { return "webhook"; }
    void arm(const std::string& reminder_id, int64_t fires_at_ms,
             const ReminderPayload& payload) override;
    void cancel(const std::string& reminder_id) override;

    const std::string& base() const { return base_; }
    const std::string& path() const { return path_; }

private:
    std::string base_;   // scheme://host[:port]
    std::string path_;
    std::map<std::string, std::string> headers_;
    int timeout_s_;

    void post(const nlohmann::json& body);
};

} // namespace dosewatch
