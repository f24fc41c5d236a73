#include "config.hpp"
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <stdexcept>

namespace dosewatch {

std::string Config::database_path() const {
    if (!database.empty()) return expand_path(database);
    return expand_path(data_dir) + "/dosewatch.db";
}

std::string Config::resolve_timezone() const {
    // 1. Explicit config
    if (!timezone.empty()) return timezone;
    // 2. Process environment
    const char* tz = std::getenv("TZ");
    if (tz && *tz) return tz;
    // 3. Fallback
    return "UTC";
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["data_dir"] = data_dir;
    if (!database.empty()) j["database"] = database;
    if (!timezone.empty()) j["timezone"] = timezone;
    j["user_id"] = user_id;
    j["profile_id"] = profile_id;

    auto& d = j["dispatcher"];
    d["type"] = dispatcher.type;
    if (!dispatcher.url.empty()) d["url"] = dispatcher.url;
    if (!dispatcher.headers.empty()) d["headers"] = dispatcher.headers;
    if (dispatcher.timeout_s != 10) d["timeout_s"] = dispatcher.timeout_s;
    d["async"] = dispatcher.async;

    auto& r = j["runner"];
    r["poll_interval_s"] = runner.poll_interval_s;
    r["upcoming_horizon_h"] = runner.upcoming_horizon_h;

    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    c.data_dir = j.value("data_dir", c.data_dir);
    c.database = j.value("database", c.database);
    c.timezone = j.value("timezone", c.timezone);
    c.user_id = j.value("user_id", c.user_id);
    c.profile_id = j.value("profile_id", c.profile_id);

    if (j.contains("dispatcher") && j["dispatcher"].is_object()) {
        auto& d = j["dispatcher"];
        c.dispatcher.type = d.value("type", c.dispatcher.type);
        c.dispatcher.url = d.value("url", "");
        c.dispatcher.timeout_s = d.value("timeout_s", 10);
        c.dispatcher.async = d.value("async", true);
        if (d.contains("headers") && d["headers"].is_object()) {
            for (auto& [hk, hv] : d["headers"].items()) {
                if (hv.is_string()) c.dispatcher.headers[hk] = hv.get<std::string>();
            }
        }
    }

    if (j.contains("runner") && j["runner"].is_object()) {
        auto& r = j["runner"];
        c.runner.poll_interval_s = r.value("poll_interval_s", c.runner.poll_interval_s);
        c.runner.upcoming_horizon_h = r.value("upcoming_horizon_h", c.runner.upcoming_horizon_h);
    }
    if (c.runner.poll_interval_s < 1) {
        std::cerr << "[config] Warning: poll_interval_s must be >= 1, using 1\n";
        c.runner.poll_interval_s = 1;
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot write config to " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace dosewatch
