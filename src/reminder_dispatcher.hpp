#pragma once
#include <string>
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>

namespace dosewatch {

struct ReminderPayload {
    std::string medication_id;
    std::string schedule_id;
    std::string dose_time_id;
};

inline nlohmann::json payload_to_json(const ReminderPayload& p) {
    return {
        {"medication_id", p.medication_id},
        {"schedule_id", p.schedule_id},
        {"dose_time_id", p.dose_time_id},
    };
}

// Platform notification layer. Both calls are idempotent: re-arming an id
// replaces its previous schedule, cancelling an unknown id is not an error.
// Implementations report failure by throwing DispatchError.
class ReminderDispatcher {
public:
    virtual ~ReminderDispatcher() = default;
    virtual std::string name() const = 0;
    virtual void arm(const std::string& reminder_id, int64_t fires_at_ms,
                     const ReminderPayload& payload) = 0;
    virtual void cancel(const std::string& reminder_id) = 0;
};

class LogDispatcher : public ReminderDispatcher {
public:
    std::string name() const override { return "log"; }

    void arm(const std::string& reminder_id, int64_t fires_at_ms,
             const ReminderPayload& payload) override {
        std::cerr << "[dispatch] arm " << reminder_id << " at " << fires_at_ms
                  << " " << payload_to_json(payload).dump() << "\n";
    }

    void cancel(const std::string& reminder_id) override {
        std::cerr << "[dispatch] cancel " << reminder_id << "\n";
    }
};

class NullDispatcher : public ReminderDispatcher {
public:
    std::string name() const override { return "none"; }
    void arm(const std::string&, int64_t, const ReminderPayload&) override {}
    void cancel(const std::string&) override {}
};

} // namespace dosewatch
