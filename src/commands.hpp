#pragma once
#include "reminder_coordinator.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>

namespace dosewatch {

int cmd_init();
int cmd_status();
int cmd_med(const std::vector<std::string>& args);
int cmd_schedule(const std::vector<std::string>& args);
int cmd_time(const std::vector<std::string>& args);
int cmd_import(const std::vector<std::string>& args);
int cmd_log(const std::vector<std::string>& args);
int cmd_history(const std::vector<std::string>& args);
int cmd_upcoming(const std::vector<std::string>& args);
int cmd_rearm();
int cmd_serve();

// "--key value" pairs, bare switches and positionals.
struct Flags {
    std::vector<std::string> positional;
    std::map<std::string, std::string> values;
    std::set<std::string> switches;

    bool has(const std::string& k) const { return values.count(k) > 0 || switches.count(k) > 0; }
    std::string get(const std::string& k, const std::string& def = "") const {
        auto it = values.find(k);
        return it != values.end() ? it->second : def;
    }
    std::optional<std::string> opt(const std::string& k) const {
        auto it = values.find(k);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }
};

// Anything named in switch_names takes no value.
Flags parse_flags(const std::vector<std::string>& args, size_t start,
                  const std::set<std::string>& switch_names = {});

// One line describing where a recompute left a dose-time.
std::string describe(const RecomputeResult& r, const std::string& tz);

} // namespace dosewatch
