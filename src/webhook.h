#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "characteristics.h"
#include "snapshot.h"

class WebhookQueue;

enum class WebhookMode {
    Batch,
    Immediate,
};

std::optional<WebhookMode> parse_webhook_mode(const std::string& text);
const char* webhook_mode_name(WebhookMode mode);

struct WebhookConfig {
    std::string url;
    WebhookMode mode = WebhookMode::Batch;
    std::vector<Characteristic> targets;
    std::chrono::milliseconds timeout{10000};
    std::optional<std::string> security_key;

    bool is_target(Characteristic c) const;
};

// One POST body. Immediate events carry a single characteristic/value,
// batch events carry the filtered snapshot in `values`.
struct WebhookEvent {
    WallTime timestamp;
    std::optional<Characteristic> characteristic;
    std::string value;
    std::vector<std::pair<Characteristic, std::string>> values;
    std::optional<std::string> security_key;

    static WebhookEvent immediate(WallTime ts, Characteristic c, std::string value,
                                  std::optional<std::string> key);
    static WebhookEvent batch(WallTime ts,
                              std::vector<std::pair<Characteristic, std::string>> values,
                              std::optional<std::string> key);

    bool is_batch() const { return !characteristic.has_value(); }
    nlohmann::ordered_json to_json() const;
};

// Turns aggregator activity into queued webhook events according to the mode.
class WebhookDispatcher {
public:
    WebhookDispatcher(WebhookConfig config, WebhookQueue& queue)
        : config_(std::move(config)), queue_(queue) {}

    // Immediate mode only: one event per targeted update.
    void on_update(Characteristic c, const std::string& value, WallTime now);
    // Batch mode only: one event per flush, filtered to the targets; nothing
    // when the filtered result is empty.
    void on_snapshot(const Snapshot& snapshot);

    const WebhookConfig& config() const { return config_; }

private:
    WebhookConfig config_;
    WebhookQueue& queue_;
};
