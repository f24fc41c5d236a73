#pragma once
#include <string>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace dosewatch {

struct DispatcherConfig {
    std::string type = "log";      // "log", "webhook" or "none"
    std::string url;               // webhook endpoint
    std::map<std::string, std::string> headers;
    int timeout_s = 10;
    bool async = true;             // run dispatch on a worker thread
};

struct RunnerConfig {
    int poll_interval_s = 30;
    int upcoming_horizon_h = 24;
};

struct Config {
    std::string data_dir = "~/.dosewatch";
    std::string database;          // empty = <data_dir>/dosewatch.db
    std::string timezone;          // default zone for new schedules (empty = $TZ, then UTC)
    std::string user_id = "local-user";
    std::string profile_id = "default";

    DispatcherConfig dispatcher;
    RunnerConfig runner;

    // Derived helpers
    std::string database_path() const;
    std::string resolve_timezone() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace dosewatch
