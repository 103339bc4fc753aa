#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "webhook.h"
#include "webhook_queue.h"

std::optional<WebhookMode> parse_webhook_mode(const std::string& text) {
    if (text == "batch") return WebhookMode::Batch;
    if (text == "immediate") return WebhookMode::Immediate;
    return std::nullopt;
}

const char* webhook_mode_name(WebhookMode mode) {
    return mode == WebhookMode::Immediate ? "immediate" : "batch";
}

bool WebhookConfig::is_target(Characteristic c) const {
    return std::find(targets.begin(), targets.end(), c) != targets.end();
}

WebhookEvent WebhookEvent::immediate(WallTime ts, Characteristic c, std::string value,
                                     std::optional<std::string> key) {
    WebhookEvent ev;
    ev.timestamp = ts;
    ev.characteristic = c;
    ev.value = std::move(value);
    ev.security_key = std::move(key);
    return ev;
}

WebhookEvent WebhookEvent::batch(WallTime ts,
                                 std::vector<std::pair<Characteristic, std::string>> values,
                                 std::optional<std::string> key) {
    WebhookEvent ev;
    ev.timestamp = ts;
    ev.values = std::move(values);
    ev.security_key = std::move(key);
    return ev;
}

nlohmann::ordered_json WebhookEvent::to_json() const {
    nlohmann::ordered_json body;
    body["timestamp"] = to_epoch_seconds(timestamp);
    if (characteristic) {
        body["characteristic"] = characteristic_name(*characteristic);
        body["value"] = value;
    } else {
        nlohmann::ordered_json map = nlohmann::ordered_json::object();
        for (const auto& [c, v] : values) map[characteristic_name(c)] = v;
        body["values"] = std::move(map);
    }
    if (security_key) body["securityKey"] = *security_key;
    return body;
}

void WebhookDispatcher::on_update(Characteristic c, const std::string& value, WallTime now) {
    if (config_.mode != WebhookMode::Immediate) return;
    if (!config_.is_target(c)) return;
    queue_.push(WebhookEvent::immediate(now, c, value, config_.security_key));
}

void WebhookDispatcher::on_snapshot(const Snapshot& snapshot) {
    if (config_.mode != WebhookMode::Batch) return;
    std::vector<std::pair<Characteristic, std::string>> filtered;
    for (const auto& entry : snapshot.entries) {
        if (config_.is_target(entry.first)) filtered.push_back(entry);
    }
    if (filtered.empty()) return;
    queue_.push(WebhookEvent::batch(snapshot.timestamp, std::move(filtered), config_.security_key));
}
