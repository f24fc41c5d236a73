#include "webhook_dispatcher.hpp"
#include "errors.hpp"
#include <httplib.h>

namespace dosewatch {

WebhookDispatcher::WebhookDispatcher(const std::string& url,
                                     std::map<std::string, std::string> headers,
                                     int timeout_s)
    : headers_(std::move(headers)), timeout_s_(timeout_s) {
    size_t pos = 0;
    if (url.rfind("http://", 0) == 0) pos = 7;
    else if (url.rfind("https://", 0) == 0) pos = 8;
    else throw std::invalid_argument("webhook url must start with http:// or https://: " + url);

    size_t slash = url.find('/', pos);
    if (slash == std::string::npos) {
        base_ = url;
        path_ = "/";
    } else {
        base_ = url.substr(0, slash);
        path_ = url.substr(slash);
    }
    if (base_.size() == pos) throw std::invalid_argument("webhook url has no host: " + url);
}

void WebhookDispatcher::arm(const std::string& reminder_id, int64_t fires_at_ms,
                            const ReminderPayload& payload) {
    post({
        {"action", "arm"},
        {"reminder_id", reminder_id},
        {"fires_at", fires_at_ms},
        {"payload", payload_to_json(payload)},
    });
}

void WebhookDispatcher::cancel(const std::string& reminder_id) {
    post({
        {"action", "cancel"},
        {"reminder_id", reminder_id},
    });
}

void WebhookDispatcher::post(const nlohmann::json& body) {
    httplib::Client cli(base_);
    if (!cli.is_valid()) {
        throw DispatchError("webhook " + base_ + " is not usable by this build (https needs OpenSSL)");
    }
    cli.set_connection_timeout(timeout_s_);
    cli.set_read_timeout(timeout_s_);

    httplib::Headers headers;
    for (auto& [k, v] : headers_) headers.emplace(k, v);

    auto res = cli.Post(path_, headers, body.dump(), "application/json");
    if (!res) {
        throw DispatchError("webhook " + base_ + path_ + " unreachable: " +
                            httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw DispatchError("webhook " + base_ + path_ + " returned HTTP " +
                            std::to_string(res->status));
    }
}

} // namespace dosewatch
